#ifndef CACHE_STORE_HPP
#define CACHE_STORE_HPP

#include "compression.hpp"
#include "encoding_codec.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <set>
#include <atomic>
#include <cstdint>
#include <optional>

namespace encache {

/**
 * Address of one cache area: a file under one encoding at one chunk size
 */
struct CacheKey {
    std::string file_id;
    Encoding encoding;
    uint64_t chunk_size;

    CacheKey();
    CacheKey(const std::string& id, Encoding enc, uint64_t size);
};

/**
 * Encoding cache store
 *
 * Layout on disk:
 *   <storage>/chunks/<file_id>/<encoding>/<chunk_size>/chunk_000000.bin
 *
 * Each chunk file holds a fixed header followed by the (optionally
 * compressed) encoded payload. Chunks are written to a temp file and renamed
 * into place, so a reader only ever sees complete entries. The directory tree
 * is the index: nothing else needs to be loaded at startup.
 */
class CacheStore {
public:
    CacheStore(const std::string& storage_path, CompressionAlgo compression = CompressionAlgo::NONE);
    virtual ~CacheStore();

    /**
     * Whether a chunk file is present
     */
    bool exists(const CacheKey& key, uint32_t chunk_index) const;

    /**
     * Read a chunk
     * @return Encoded bytes, nullopt if absent or unreadable
     */
    std::optional<std::string> get(const CacheKey& key, uint32_t chunk_index) const;

    /**
     * Write a chunk atomically
     * @return NONE on success, CACHE_WRITE_FAILURE otherwise (nothing left behind)
     */
    ErrorCode put(const CacheKey& key, uint32_t chunk_index, const std::string& data);

    /**
     * Number of distinct chunk indices stored for a cache area
     */
    size_t count(const CacheKey& key) const;

    /**
     * Stored chunk indices, ascending
     */
    std::vector<uint32_t> indices(const CacheKey& key) const;

    /**
     * Highest stored chunk index
     */
    std::optional<uint32_t> last_index(const CacheKey& key) const;

    /**
     * Sum of the encoded (uncompressed) sizes of all stored chunks
     */
    uint64_t encoded_bytes(const CacheKey& key) const;

    /**
     * Remove every cache area of a file
     * @return NONE if nothing of the file is left on disk, CACHE_WRITE_FAILURE otherwise
     */
    virtual ErrorCode clear_file(const std::string& file_id);

    /**
     * Remove every chunk size of one encoding of a file
     */
    bool clear_encoding(const std::string& file_id, Encoding encoding);

    /**
     * Remove cache directories whose file_id is not in active_ids
     * @return Number of file caches removed
     */
    size_t prune_orphans(const std::set<std::string>& active_ids);

    /**
     * File ids that currently own a cache directory
     */
    std::vector<std::string> cached_file_ids() const;

    /**
     * Total bytes of chunk storage on disk
     */
    size_t get_storage_size() const;

    CompressionAlgo compression() const { return compression_; }
    const std::string& storage_path() const { return storage_path_; }

private:
    std::string storage_path_;
    std::string chunks_dir_;
    CompressionAlgo compression_;
    std::atomic<uint64_t> temp_counter_;

    // Helper methods
    std::string get_file_dir(const std::string& file_id) const;
    std::string get_area_path(const CacheKey& key) const;
    std::string get_chunk_path(const CacheKey& key, uint32_t chunk_index) const;
    static std::optional<uint32_t> parse_chunk_name(const std::string& filename);
};

} // namespace encache

#endif // CACHE_STORE_HPP
