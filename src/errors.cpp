#include "errors.hpp"

namespace encache {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::CHUNK_INDEX_OUT_OF_RANGE: return "CHUNK_INDEX_OUT_OF_RANGE";
        case ErrorCode::UNSUPPORTED_ENCODING: return "UNSUPPORTED_ENCODING";
        case ErrorCode::INVALID_CHUNK_SIZE: return "INVALID_CHUNK_SIZE";
        case ErrorCode::MALFORMED_INPUT: return "MALFORMED_INPUT";
        case ErrorCode::CACHE_WRITE_FAILURE: return "CACHE_WRITE_FAILURE";
        case ErrorCode::PLANNING_INCONSISTENCY: return "PLANNING_INCONSISTENCY";
        case ErrorCode::IO_FAILURE: return "IO_FAILURE";
    }
    return "UNKNOWN";
}

bool is_retryable(ErrorCode code) {
    return code == ErrorCode::CACHE_WRITE_FAILURE || code == ErrorCode::IO_FAILURE;
}

} // namespace encache
