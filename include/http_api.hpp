#ifndef HTTP_API_HPP
#define HTTP_API_HPP

#include "encoding_codec.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <utility>
#include <cstdint>
#include <optional>

namespace encache {

class EncodingCache;

/**
 * Response produced by the router, independent of the transport
 */
struct ApiResponse {
    int status;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    ApiResponse();

    /**
     * Value of a header, nullopt if not set
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * HTTP API router
 *
 *   GET    /health
 *   GET    /files
 *   GET    /encodings
 *   GET    /file/{file_id}/info?encoding=&chunk_size=
 *   GET    /chunk/{file_id}/{chunk_index}?encoding=&chunk_size=&format=json|raw
 *   DELETE /file/{file_id}
 *   DELETE /file/{file_id}/cache?encoding=
 *
 * Every response carries permissive CORS headers; OPTIONS answers 204.
 * Errors are {"detail": message, "error": CODE}.
 */
class ApiRouter {
public:
    explicit ApiRouter(EncodingCache& cache);

    /**
     * Dispatch one request
     * @param method HTTP method, upper case
     * @param target Request target (path and query string)
     */
    ApiResponse handle(const std::string& method, const std::string& target);

    static std::map<std::string, std::string> parse_query(const std::string& query);
    static std::string url_decode(const std::string& text);

    /**
     * Map every byte to the code point of the same value, as UTF-8
     * Keeps yEnc output (arbitrary bytes) valid inside a JSON string.
     */
    static std::string latin1_to_utf8(const std::string& bytes);

    /**
     * HTTP status for a service error
     */
    static int status_for(ErrorCode error);

private:
    EncodingCache& cache_;

    // Route handlers
    ApiResponse handle_health();
    ApiResponse handle_files();
    ApiResponse handle_encodings();
    ApiResponse handle_info(const std::string& file_id, const std::map<std::string, std::string>& query);
    ApiResponse handle_chunk(const std::string& file_id, const std::string& chunk_number,
                             const std::map<std::string, std::string>& query);
    ApiResponse handle_delete_file(const std::string& file_id);
    ApiResponse handle_clear_cache(const std::string& file_id, const std::map<std::string, std::string>& query);

    // Query parameters; on failure fill the error response and return nullopt
    std::optional<Encoding> encoding_param(const std::map<std::string, std::string>& query,
                                           ApiResponse& error) const;
    std::optional<uint64_t> chunk_size_param(const std::map<std::string, std::string>& query,
                                             ApiResponse& error) const;

    // Response builders
    static ApiResponse json_response(int status, const nlohmann::json& body);
    static ApiResponse error_response(ErrorCode error, const std::string& detail);
    static ApiResponse error_response(int status, const std::string& error, const std::string& detail);
    static void add_cors_headers(ApiResponse& response);
};

} // namespace encache

#endif // HTTP_API_HPP
