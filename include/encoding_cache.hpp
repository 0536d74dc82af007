#ifndef ENCODING_CACHE_HPP
#define ENCODING_CACHE_HPP

#include "chunk_service.hpp"
#include "compression.hpp"
#include "encoding_codec.hpp"
#include "errors.hpp"
#include "file_registry.hpp"
#include "info_service.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <optional>

namespace encache {

class CacheStore;
class ChunkPlanner;

/**
 * Service configuration
 */
struct CacheConfig {
    // Locations
    std::string input_dir;          // Scanned for source files
    std::string cache_dir;          // Root of the chunk cache

    // Chunking
    uint64_t default_chunk_size;    // Target encoded bytes per chunk (1 MiB)
    uint64_t min_chunk_size;
    uint64_t max_chunk_size;
    Encoding default_encoding;

    // Storage
    CompressionAlgo cache_compression;  // At-rest compression of chunk payloads
    bool prune_orphans_on_start;        // Drop caches of files no longer present

    // Codec
    bool hex_uppercase;             // Changing this requires clearing the hex cache

    bool rescan_on_list;            // GET /files and /health rescan input_dir

    CacheConfig();
    static CacheConfig default_config();
    static CacheConfig config_for_low_disk();       // Zstandard max on every chunk
    static CacheConfig config_for_throughput();     // Chunks stored uncompressed
};

/**
 * Cache statistics
 */
struct CacheStats {
    size_t registered_files;
    size_t cached_files;            // Files owning a cache directory
    size_t storage_bytes;           // Chunk files on disk, headers included
    uint64_t encode_operations;
    uint64_t cache_hits;
    size_t memoized_layouts;

    CacheStats();
};

/**
 * Adaptive multi-codec chunk cache
 *
 * Owns the file registry, the chunk planner, the cache store and the two
 * services built on them. Construction scans the input directory and, when
 * configured, removes cache directories left behind by files that are gone.
 */
class EncodingCache {
public:
    explicit EncodingCache(const CacheConfig& config = CacheConfig::default_config());
    ~EncodingCache();

    EncodingCache(const EncodingCache&) = delete;
    EncodingCache& operator=(const EncodingCache&) = delete;

    // ==================== Files ====================

    /**
     * Rescan the input directory
     * Files dropped by the scan lose their cache and memoized layouts.
     */
    std::vector<FileRecord> rescan();

    /**
     * Registered files, rescanning first when rescan_on_list is set
     */
    std::vector<FileRecord> list_files();

    std::optional<FileRecord> register_file(const std::string& path);
    std::optional<FileRecord> lookup(const std::string& file_id) const;

    /**
     * Remove a file and all of its cached chunks
     * @return FILE_NOT_FOUND if file_id is unknown, CACHE_WRITE_FAILURE if the
     *         cache could not be deleted (the file stays registered)
     */
    ErrorCode remove_file(const std::string& file_id);

    /**
     * Clear one encoding of a file
     * @return FILE_NOT_FOUND if file_id is unknown, NONE otherwise
     */
    ErrorCode clear_encoding(const std::string& file_id, Encoding encoding);

    size_t file_count() const;

    // ==================== Chunks ====================

    ChunkResult get_chunk(const std::string& file_id, Encoding encoding,
                          uint32_t chunk_index, uint64_t chunk_size);

    FileInfo get_info(const std::string& file_id, Encoding encoding, uint64_t chunk_size);

    // ==================== Statistics ====================

    CacheStats get_stats() const;
    void print_stats() const;

    const CacheConfig& config() const { return config_; }

private:
    CacheConfig config_;

    std::unique_ptr<CacheStore> store_;
    std::unique_ptr<ChunkPlanner> planner_;
    std::unique_ptr<FileRegistry> registry_;
    std::unique_ptr<ChunkService> chunks_;
    std::unique_ptr<InfoService> info_;
};

} // namespace encache

#endif // ENCODING_CACHE_HPP
