#include "cache_store.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace encache {

namespace {

constexpr char kChunkMagic[4] = {'E', 'C', 'H', 'K'};
constexpr uint8_t kChunkVersion = 1;
constexpr size_t kChunkHeaderSize = 24;
constexpr size_t kChunkDigits = 6;
constexpr uint64_t kMaxChunkBytes = 64ULL * 1024 * 1024;

struct ChunkHeader {
    uint8_t version;
    CompressionAlgo algo;
    uint64_t encoded_size;      // Size after decompression
    uint64_t stored_size;       // Payload bytes following the header

    ChunkHeader()
        : version(kChunkVersion)
        , algo(CompressionAlgo::NONE)
        , encoded_size(0)
        , stored_size(0) {
    }
};

void write_header(std::ofstream& file, const ChunkHeader& header) {
    uint8_t algo = static_cast<uint8_t>(header.algo);
    uint16_t reserved = 0;
    file.write(kChunkMagic, sizeof(kChunkMagic));
    file.write(reinterpret_cast<const char*>(&header.version), sizeof(header.version));
    file.write(reinterpret_cast<const char*>(&algo), sizeof(algo));
    file.write(reinterpret_cast<const char*>(&reserved), sizeof(reserved));
    file.write(reinterpret_cast<const char*>(&header.encoded_size), sizeof(header.encoded_size));
    file.write(reinterpret_cast<const char*>(&header.stored_size), sizeof(header.stored_size));
}

bool read_header(std::ifstream& file, ChunkHeader& header) {
    char magic[4];
    uint8_t algo = 0;
    uint16_t reserved = 0;
    file.read(magic, sizeof(magic));
    file.read(reinterpret_cast<char*>(&header.version), sizeof(header.version));
    file.read(reinterpret_cast<char*>(&algo), sizeof(algo));
    file.read(reinterpret_cast<char*>(&reserved), sizeof(reserved));
    file.read(reinterpret_cast<char*>(&header.encoded_size), sizeof(header.encoded_size));
    file.read(reinterpret_cast<char*>(&header.stored_size), sizeof(header.stored_size));
    if (!file) {
        return false;
    }
    if (!std::equal(std::begin(kChunkMagic), std::end(kChunkMagic), magic)) {
        return false;
    }
    if (header.version != kChunkVersion || algo > static_cast<uint8_t>(CompressionAlgo::ZSTD_MAX)) {
        return false;
    }
    header.algo = static_cast<CompressionAlgo>(algo);
    return true;
}

} // namespace

// ==================== CacheKey ====================

CacheKey::CacheKey()
    : encoding(Encoding::BASE64)
    , chunk_size(0) {
}

CacheKey::CacheKey(const std::string& id, Encoding enc, uint64_t size)
    : file_id(id)
    , encoding(enc)
    , chunk_size(size) {
}

// ==================== CacheStore ====================

CacheStore::CacheStore(const std::string& storage_path, CompressionAlgo compression)
    : storage_path_(storage_path)
    , chunks_dir_(storage_path + "/chunks")
    , compression_(compression)
    , temp_counter_(0) {

    // Create chunks directory if it doesn't exist
    std::error_code ec;
    fs::create_directories(chunks_dir_, ec);
    if (ec) {
        std::cerr << "Failed to create cache directory " << chunks_dir_ << ": " << ec.message() << std::endl;
    }
}

CacheStore::~CacheStore() = default;

bool CacheStore::exists(const CacheKey& key, uint32_t chunk_index) const {
    std::error_code ec;
    return fs::is_regular_file(get_chunk_path(key, chunk_index), ec);
}

std::optional<std::string> CacheStore::get(const CacheKey& key, uint32_t chunk_index) const {
    std::string chunk_path = get_chunk_path(key, chunk_index);
    std::ifstream chunk_file(chunk_path, std::ios::binary);
    if (!chunk_file) {
        return std::nullopt;
    }

    ChunkHeader header;
    if (!read_header(chunk_file, header)) {
        std::cerr << "Ignoring chunk with bad header: " << chunk_path << std::endl;
        return std::nullopt;
    }

    std::error_code ec;
    uintmax_t file_size = fs::file_size(chunk_path, ec);
    if (ec || header.encoded_size > kMaxChunkBytes || file_size != kChunkHeaderSize + header.stored_size) {
        std::cerr << "Ignoring truncated chunk: " << chunk_path << std::endl;
        return std::nullopt;
    }

    std::vector<uint8_t> payload(header.stored_size);
    chunk_file.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    if (chunk_file.gcount() != static_cast<std::streamsize>(payload.size()) ||
        chunk_file.peek() != std::ifstream::traits_type::eof()) {
        std::cerr << "Ignoring truncated chunk: " << chunk_path << std::endl;
        return std::nullopt;
    }

    auto data = decompress_with_algo(payload, header.algo, header.encoded_size);
    if (!data) {
        std::cerr << "Ignoring undecodable chunk: " << chunk_path << std::endl;
        return std::nullopt;
    }
    return data;
}

ErrorCode CacheStore::put(const CacheKey& key, uint32_t chunk_index, const std::string& data) {
    std::error_code ec;
    std::string area_path = get_area_path(key);
    fs::create_directories(area_path, ec);
    if (ec) {
        std::cerr << "Failed to create cache area " << area_path << ": " << ec.message() << std::endl;
        return ErrorCode::CACHE_WRITE_FAILURE;
    }

    // Keep the compressed form only when it actually saves space
    ChunkHeader header;
    header.encoded_size = data.size();
    std::vector<uint8_t> payload;
    if (compression_ != CompressionAlgo::NONE && !data.empty()) {
        auto compressed = compress_with_algo(data, compression_);
        if (compressed && compressed->size() < data.size()) {
            header.algo = compression_;
            payload = std::move(*compressed);
        }
    }
    if (header.algo == CompressionAlgo::NONE) {
        payload.assign(data.begin(), data.end());
    }
    header.stored_size = payload.size();

    std::string chunk_path = get_chunk_path(key, chunk_index);
    std::string temp_path = chunk_path + ".tmp." +
        std::to_string(std::hash<std::thread::id>()(std::this_thread::get_id())) + "." +
        std::to_string(++temp_counter_);

    {
        std::ofstream chunk_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!chunk_file) {
            std::cerr << "Failed to open chunk for writing: " << temp_path << std::endl;
            return ErrorCode::CACHE_WRITE_FAILURE;
        }
        write_header(chunk_file, header);
        chunk_file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        chunk_file.flush();
        if (!chunk_file) {
            chunk_file.close();
            fs::remove(temp_path, ec);
            std::cerr << "Failed to write chunk: " << chunk_path << std::endl;
            return ErrorCode::CACHE_WRITE_FAILURE;
        }
    }

    fs::rename(temp_path, chunk_path, ec);
    if (ec) {
        std::cerr << "Failed to publish chunk " << chunk_path << ": " << ec.message() << std::endl;
        std::error_code remove_ec;
        fs::remove(temp_path, remove_ec);
        return ErrorCode::CACHE_WRITE_FAILURE;
    }
    return ErrorCode::NONE;
}

size_t CacheStore::count(const CacheKey& key) const {
    return indices(key).size();
}

std::vector<uint32_t> CacheStore::indices(const CacheKey& key) const {
    std::vector<uint32_t> result;
    std::error_code ec;
    fs::directory_iterator it(get_area_path(key), ec);
    if (ec) {
        return result;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }
        auto index = parse_chunk_name(entry.path().filename().string());
        if (index) {
            result.push_back(*index);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

std::optional<uint32_t> CacheStore::last_index(const CacheKey& key) const {
    std::vector<uint32_t> stored = indices(key);
    if (stored.empty()) {
        return std::nullopt;
    }
    return stored.back();
}

uint64_t CacheStore::encoded_bytes(const CacheKey& key) const {
    uint64_t total = 0;
    for (uint32_t index : indices(key)) {
        std::ifstream chunk_file(get_chunk_path(key, index), std::ios::binary);
        ChunkHeader header;
        if (chunk_file && read_header(chunk_file, header)) {
            total += header.encoded_size;
        }
    }
    return total;
}

ErrorCode CacheStore::clear_file(const std::string& file_id) {
    std::error_code ec;
    std::string file_dir = get_file_dir(file_id);
    if (!fs::exists(file_dir, ec)) {
        return ErrorCode::NONE;
    }

    fs::remove_all(file_dir, ec);
    if (ec) {
        std::cerr << "Failed to clear cache of " << file_id << ": " << ec.message() << std::endl;
        return ErrorCode::CACHE_WRITE_FAILURE;
    }
    return ErrorCode::NONE;
}

bool CacheStore::clear_encoding(const std::string& file_id, Encoding encoding) {
    std::error_code ec;
    std::string encoding_dir = get_file_dir(file_id) + "/" + encoding_name(encoding);
    if (!fs::exists(encoding_dir, ec)) {
        return false;
    }

    fs::remove_all(encoding_dir, ec);
    if (ec) {
        std::cerr << "Failed to clear " << encoding_name(encoding) << " cache of "
                  << file_id << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

size_t CacheStore::prune_orphans(const std::set<std::string>& active_ids) {
    size_t removed = 0;
    for (const std::string& file_id : cached_file_ids()) {
        if (active_ids.count(file_id) == 0 && clear_file(file_id) == ErrorCode::NONE) {
            removed++;
        }
    }
    return removed;
}

std::vector<std::string> CacheStore::cached_file_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    fs::directory_iterator it(chunks_dir_, ec);
    if (ec) {
        return ids;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            ids.push_back(entry.path().filename().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t CacheStore::get_storage_size() const {
    size_t total = 0;
    std::error_code ec;

    if (fs::exists(chunks_dir_, ec)) {
        for (fs::recursive_directory_iterator it(chunks_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code size_ec;
            if (it->is_regular_file(size_ec)) {
                uintmax_t size = it->file_size(size_ec);
                if (!size_ec) {
                    total += size;
                }
            }
        }
    }

    return total;
}

std::string CacheStore::get_file_dir(const std::string& file_id) const {
    return chunks_dir_ + "/" + file_id;
}

std::string CacheStore::get_area_path(const CacheKey& key) const {
    return get_file_dir(key.file_id) + "/" + encoding_name(key.encoding) + "/" +
           std::to_string(key.chunk_size);
}

std::string CacheStore::get_chunk_path(const CacheKey& key, uint32_t chunk_index) const {
    std::string number = std::to_string(chunk_index);
    if (number.size() < kChunkDigits) {
        number.insert(0, kChunkDigits - number.size(), '0');
    }
    return get_area_path(key) + "/chunk_" + number + ".bin";
}

std::optional<uint32_t> CacheStore::parse_chunk_name(const std::string& filename) {
    const std::string prefix = "chunk_";
    const std::string suffix = ".bin";
    if (filename.size() <= prefix.size() + suffix.size() ||
        filename.compare(0, prefix.size(), prefix) != 0 ||
        filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::nullopt;
    }

    std::string digits = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    if (digits.size() > 10 ||
        !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    unsigned long long value = std::stoull(digits);
    if (value > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

} // namespace encache
