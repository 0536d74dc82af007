#ifndef INFO_SERVICE_HPP
#define INFO_SERVICE_HPP

#include "encoding_codec.hpp"
#include "errors.hpp"
#include <string>
#include <cstdint>

namespace encache {

class FileRegistry;
class CacheStore;
class ChunkPlanner;

/**
 * File metadata for one encoding and chunk size
 *
 * When is_processed is false, total_chunks and encoded_size are estimates from
 * the codec ratio. cached_chunks is always the real number on disk.
 */
struct FileInfo {
    bool success;
    ErrorCode error;
    std::string message;

    std::string file_id;
    std::string filename;
    uint64_t original_size;
    Encoding encoding;
    uint64_t chunk_size;
    uint32_t total_chunks;
    size_t cached_chunks;
    uint64_t encoded_size;
    bool is_processed;

    FileInfo();
};

/**
 * Read-only view over the registry and the cache
 */
class InfoService {
public:
    InfoService(FileRegistry& registry, CacheStore& store, ChunkPlanner& planner);

    FileInfo get_info(const std::string& file_id, Encoding encoding, uint64_t chunk_size);

    /**
     * ceil(size * ratio / chunk_size), at least 1
     */
    static uint32_t estimate_chunk_count(Encoding encoding, uint64_t original_size, uint64_t chunk_size);

private:
    FileRegistry& registry_;
    CacheStore& store_;
    ChunkPlanner& planner_;
};

} // namespace encache

#endif // INFO_SERVICE_HPP
