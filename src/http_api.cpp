#include "http_api.hpp"
#include "encoding_cache.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace encache {

namespace {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(ApiRouter::url_decode(path.substr(start, end - start)));
        }
        start = end + 1;
    }
    return segments;
}

// Decimal digits only, no sign, no overflow
std::optional<uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text.size() > 19 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return std::stoull(text);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string dump(const json& body) {
    // Filenames are not guaranteed to be UTF-8
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

// ==================== ApiResponse ====================

ApiResponse::ApiResponse()
    : status(200)
    , content_type("application/json") {
}

std::optional<std::string> ApiResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

// ==================== ApiRouter ====================

ApiRouter::ApiRouter(EncodingCache& cache)
    : cache_(cache) {
}

ApiResponse ApiRouter::handle(const std::string& method, const std::string& target) {
    ApiResponse response;
    try {
        size_t query_start = target.find('?');
        std::string path = target.substr(0, query_start);
        std::map<std::string, std::string> query;
        if (query_start != std::string::npos) {
            query = parse_query(target.substr(query_start + 1));
        }
        std::vector<std::string> segments = split_path(path);

        // Which methods the matched route accepts; empty if no route matched
        std::vector<std::string> allowed;
        bool handled = false;

        auto route = [&](const std::string& route_method, auto&& handler) {
            allowed.push_back(route_method);
            if (!handled && method == route_method) {
                response = handler();
                handled = true;
            }
        };

        if (method == "OPTIONS") {
            response.status = 204;
            response.content_type.clear();
            handled = true;
        } else if (segments.size() == 1 && segments[0] == "health") {
            route("GET", [&] { return handle_health(); });
        } else if (segments.size() == 1 && segments[0] == "files") {
            route("GET", [&] { return handle_files(); });
        } else if (segments.size() == 1 && segments[0] == "encodings") {
            route("GET", [&] { return handle_encodings(); });
        } else if (segments.size() == 2 && segments[0] == "file") {
            route("DELETE", [&] { return handle_delete_file(segments[1]); });
        } else if (segments.size() == 3 && segments[0] == "file" && segments[2] == "info") {
            route("GET", [&] { return handle_info(segments[1], query); });
        } else if (segments.size() == 3 && segments[0] == "file" && segments[2] == "cache") {
            route("DELETE", [&] { return handle_clear_cache(segments[1], query); });
        } else if (segments.size() == 3 && segments[0] == "chunk") {
            route("GET", [&] { return handle_chunk(segments[1], segments[2], query); });
        }

        if (!handled) {
            if (allowed.empty()) {
                response = error_response(404, "NOT_FOUND", "No route for " + path);
            } else {
                response = error_response(405, "METHOD_NOT_ALLOWED", method + " not allowed on " + path);
                std::string allow;
                for (const std::string& m : allowed) {
                    allow += (allow.empty() ? "" : ", ") + m;
                }
                response.headers.emplace_back("Allow", allow + ", OPTIONS");
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Request " << method << " " << target << " failed: " << e.what() << std::endl;
        response = error_response(500, "INTERNAL_ERROR", "Internal server error");
    }

    add_cors_headers(response);
    return response;
}

std::map<std::string, std::string> ApiRouter::parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            // First occurrence wins
            params.emplace(key, value);
        }
        start = end + 1;
    }
    return params;
}

std::string ApiRouter::url_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            decoded += static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2]));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

std::string ApiRouter::latin1_to_utf8(const std::string& bytes) {
    std::string utf8;
    utf8.reserve(bytes.size() + bytes.size() / 2);
    for (unsigned char c : bytes) {
        if (c < 0x80) {
            utf8 += static_cast<char>(c);
        } else {
            utf8 += static_cast<char>(0xC0 | (c >> 6));
            utf8 += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return utf8;
}

int ApiRouter::status_for(ErrorCode error) {
    switch (error) {
        case ErrorCode::NONE:
            return 200;
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::CHUNK_INDEX_OUT_OF_RANGE:
            return 404;
        case ErrorCode::UNSUPPORTED_ENCODING:
        case ErrorCode::MALFORMED_INPUT:
            return 400;
        case ErrorCode::INVALID_CHUNK_SIZE:
            return 422;
        case ErrorCode::CACHE_WRITE_FAILURE:
            return 503;
        case ErrorCode::PLANNING_INCONSISTENCY:
        case ErrorCode::IO_FAILURE:
            return 500;
    }
    return 500;
}

// ==================== Route Handlers ====================

ApiResponse ApiRouter::handle_health() {
    size_t files = cache_.list_files().size();
    return json_response(200, json{{"status", "healthy"}, {"files_processed", files}});
}

ApiResponse ApiRouter::handle_files() {
    const CacheConfig& config = cache_.config();
    json files = json::array();
    for (const FileRecord& record : cache_.list_files()) {
        FileInfo info = cache_.get_info(record.file_id, config.default_encoding, config.default_chunk_size);
        if (!info.success) {
            // Removed between listing and lookup
            continue;
        }
        files.push_back({
            {"file_id", record.file_id},
            {"filename", record.filename},
            {"original_size", record.original_size},
            {"encoding", encoding_name(info.encoding)},
            {"total_chunks", info.total_chunks},
            {"encoded_size", info.encoded_size},
            {"is_processed", info.is_processed}
        });
    }
    return json_response(200, json{{"files", files}});
}

ApiResponse ApiRouter::handle_encodings() {
    json encodings = json::array();
    for (Encoding encoding : all_encodings()) {
        const EncodingProfile& profile = get_profile(encoding);
        encodings.push_back({
            {"name", profile.name},
            {"expansion_ratio", profile.expansion_ratio()},
            {"ratio_num", profile.ratio_num},
            {"ratio_den", profile.ratio_den},
            {"raw_alignment", profile.raw_alignment},
            {"fixed_ratio", profile.fixed_ratio}
        });
    }
    return json_response(200, json{
        {"encodings", encodings},
        {"default_encoding", encoding_name(cache_.config().default_encoding)}
    });
}

ApiResponse ApiRouter::handle_info(const std::string& file_id, const std::map<std::string, std::string>& query) {
    ApiResponse error;
    auto encoding = encoding_param(query, error);
    if (!encoding) {
        return error;
    }
    auto chunk_size = chunk_size_param(query, error);
    if (!chunk_size) {
        return error;
    }

    FileInfo info = cache_.get_info(file_id, *encoding, *chunk_size);
    if (!info.success) {
        return error_response(info.error, info.message);
    }

    return json_response(200, json{
        {"file_id", info.file_id},
        {"filename", info.filename},
        {"original_size", info.original_size},
        {"encoding", encoding_name(info.encoding)},
        {"chunk_size_used", info.chunk_size},
        {"default_chunk_size", cache_.config().default_chunk_size},
        {"total_chunks", info.total_chunks},
        {"cached_chunks", info.cached_chunks},
        {"encoded_size", info.encoded_size},
        {"is_processed", info.is_processed}
    });
}

ApiResponse ApiRouter::handle_chunk(const std::string& file_id, const std::string& chunk_number,
                                    const std::map<std::string, std::string>& query) {
    ApiResponse error;
    auto encoding = encoding_param(query, error);
    if (!encoding) {
        return error;
    }
    auto chunk_size = chunk_size_param(query, error);
    if (!chunk_size) {
        return error;
    }

    std::string format = "json";
    auto format_it = query.find("format");
    if (format_it != query.end()) {
        format = format_it->second;
    }
    if (format != "json" && format != "raw") {
        return error_response(ErrorCode::MALFORMED_INPUT, "format must be 'json' or 'raw'");
    }

    if (!chunk_number.empty() && chunk_number[0] == '-' &&
        parse_unsigned(chunk_number.substr(1))) {
        return error_response(ErrorCode::CHUNK_INDEX_OUT_OF_RANGE, "Chunk " + chunk_number + " out of range");
    }
    auto index = parse_unsigned(chunk_number);
    if (!index) {
        return error_response(422, error_code_name(ErrorCode::MALFORMED_INPUT),
                              "chunk index must be a non-negative integer");
    }
    if (*index > UINT32_MAX) {
        return error_response(ErrorCode::CHUNK_INDEX_OUT_OF_RANGE, "Chunk " + chunk_number + " out of range");
    }

    ChunkResult chunk = cache_.get_chunk(file_id, *encoding, static_cast<uint32_t>(*index), *chunk_size);
    if (!chunk.success) {
        return error_response(chunk.error, chunk.message);
    }

    if (format == "raw") {
        ApiResponse response;
        response.content_type = "application/octet-stream";
        response.headers.emplace_back("X-Chunk-Number", std::to_string(chunk.chunk_index));
        response.headers.emplace_back("X-Total-Chunks", std::to_string(chunk.total_chunks));
        response.headers.emplace_back("X-Is-Last", chunk.is_last ? "true" : "false");
        response.headers.emplace_back("X-Chunk-Size-Used", std::to_string(chunk.chunk_size));
        response.headers.emplace_back("X-Encoding", encoding_name(chunk.encoding));
        response.headers.emplace_back("Access-Control-Expose-Headers",
                                      "X-Chunk-Number, X-Total-Chunks, X-Is-Last, X-Chunk-Size-Used, X-Encoding");
        response.body = std::move(chunk.data);
        return response;
    }

    size_t actual_size = chunk.data.size();
    std::string data = chunk.encoding == Encoding::YENC ? latin1_to_utf8(chunk.data) : std::move(chunk.data);
    return json_response(200, json{
        {"chunk_number", chunk.chunk_index},
        {"total_chunks", chunk.total_chunks},
        {"data", data},
        {"is_last", chunk.is_last},
        {"chunk_size_used", chunk.chunk_size},
        {"actual_chunk_size", actual_size},
        {"encoding", encoding_name(chunk.encoding)}
    });
}

ApiResponse ApiRouter::handle_delete_file(const std::string& file_id) {
    ErrorCode removed = cache_.remove_file(file_id);
    if (removed == ErrorCode::FILE_NOT_FOUND) {
        return error_response(removed, "File not found: " + file_id);
    }
    if (removed != ErrorCode::NONE) {
        return error_response(removed, "Cached chunks of " + file_id + " could not be deleted; retry");
    }
    return json_response(200, json{{"message", "File deleted successfully"}, {"file_id", file_id}});
}

ApiResponse ApiRouter::handle_clear_cache(const std::string& file_id,
                                          const std::map<std::string, std::string>& query) {
    ApiResponse error;
    auto encoding = encoding_param(query, error);
    if (!encoding) {
        return error;
    }

    ErrorCode cleared = cache_.clear_encoding(file_id, *encoding);
    if (cleared != ErrorCode::NONE) {
        return error_response(cleared, "File not found: " + file_id);
    }
    return json_response(200, json{
        {"message", "Cache cleared"},
        {"file_id", file_id},
        {"encoding", encoding_name(*encoding)}
    });
}

// ==================== Parameters ====================

std::optional<Encoding> ApiRouter::encoding_param(const std::map<std::string, std::string>& query,
                                                  ApiResponse& error) const {
    auto it = query.find("encoding");
    if (it == query.end()) {
        return cache_.config().default_encoding;
    }
    auto encoding = parse_encoding(it->second);
    if (!encoding) {
        error = error_response(ErrorCode::UNSUPPORTED_ENCODING, "Unsupported encoding: " + it->second);
    }
    return encoding;
}

std::optional<uint64_t> ApiRouter::chunk_size_param(const std::map<std::string, std::string>& query,
                                                    ApiResponse& error) const {
    auto it = query.find("chunk_size");
    if (it == query.end()) {
        return cache_.config().default_chunk_size;
    }
    auto chunk_size = parse_unsigned(it->second);
    if (!chunk_size) {
        error = error_response(ErrorCode::INVALID_CHUNK_SIZE, "chunk_size must be an integer");
    }
    return chunk_size;
}

// ==================== Response Builders ====================

ApiResponse ApiRouter::json_response(int status, const json& body) {
    ApiResponse response;
    response.status = status;
    response.content_type = "application/json";
    response.body = dump(body);
    return response;
}

ApiResponse ApiRouter::error_response(ErrorCode error, const std::string& detail) {
    ApiResponse response = error_response(status_for(error), error_code_name(error), detail);
    if (is_retryable(error)) {
        response.headers.emplace_back("Retry-After", "1");
    }
    return response;
}

ApiResponse ApiRouter::error_response(int status, const std::string& error, const std::string& detail) {
    return json_response(status, json{{"detail", detail}, {"error", error}});
}

void ApiRouter::add_cors_headers(ApiResponse& response) {
    response.headers.emplace_back("Access-Control-Allow-Origin", "*");
    response.headers.emplace_back("Access-Control-Allow-Methods", "GET, DELETE, OPTIONS");
    response.headers.emplace_back("Access-Control-Allow-Headers", "*");
}

} // namespace encache
