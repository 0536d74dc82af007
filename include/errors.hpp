#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>

namespace encache {

/**
 * Error taxonomy shared by every service result
 */
enum class ErrorCode {
    NONE,
    FILE_NOT_FOUND,           // Unknown file_id
    CHUNK_INDEX_OUT_OF_RANGE, // Index past the planned chunk count
    UNSUPPORTED_ENCODING,     // Unknown codec name
    INVALID_CHUNK_SIZE,       // Target chunk size outside configured bounds
    MALFORMED_INPUT,          // Decode-side: bad alphabet, padding or escape
    CACHE_WRITE_FAILURE,      // Disk full / permission; safe to retry
    PLANNING_INCONSISTENCY,   // Internal invariant violation; not retried
    IO_FAILURE                // Source file could not be opened
};

/**
 * Stable upper-case name, used in API error bodies
 */
const char* error_code_name(ErrorCode code);

/**
 * Transient errors that a client may retry unchanged
 */
bool is_retryable(ErrorCode code);

} // namespace encache

#endif // ERRORS_HPP
