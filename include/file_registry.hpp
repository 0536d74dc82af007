#ifndef FILE_REGISTRY_HPP
#define FILE_REGISTRY_HPP

#include "encoding_codec.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <cstdint>
#include <optional>

namespace encache {

class CacheStore;

/**
 * A source file known to the service
 */
struct FileRecord {
    std::string file_id;        // Derived from canonical path + size + mtime
    std::string path;           // Canonical path
    std::string filename;
    uint64_t original_size;
    int64_t mtime;              // Nanoseconds since the filesystem clock epoch

    FileRecord();
};

/**
 * Shared hold on a registered file
 *
 * While a lease is alive the file cannot be removed, so chunks written under
 * it can never outlive the record they belong to.
 */
class FileLease {
public:
    FileLease(const FileRecord& record,
              std::shared_ptr<std::shared_mutex> gate,
              std::shared_lock<std::shared_mutex>&& hold);

    const FileRecord& record() const { return record_; }

private:
    FileRecord record_;
    std::shared_ptr<std::shared_mutex> gate_;
    std::shared_lock<std::shared_mutex> hold_;
};

/**
 * In-memory file registry
 *
 * Not durable: rebuilt by scanning the input directory at startup. Because
 * ids are deterministic, a rescan reattaches the caches of unchanged files.
 */
class FileRegistry {
public:
    explicit FileRegistry(CacheStore& store);
    ~FileRegistry();

    /**
     * Register every regular, non-hidden file in a directory (not recursive)
     * Records under that directory whose file vanished or changed are removed
     * together with their caches.
     * @return Records found, sorted by filename
     */
    std::vector<FileRecord> scan(const std::string& directory);

    std::optional<FileRecord> lookup(const std::string& file_id) const;

    /**
     * Register a single file (programmatic uploads)
     * @return nullopt if path is not a readable regular file
     */
    std::optional<FileRecord> register_file(const std::string& path);

    /**
     * Remove a record and every cached chunk of it, across all encodings
     * Waits for in-flight chunk production on the file to finish. The record
     * is kept when its cache cannot be deleted, so the removal can be retried.
     * @return NONE, FILE_NOT_FOUND or CACHE_WRITE_FAILURE
     */
    ErrorCode remove(const std::string& file_id);

    /**
     * Drop the cache of one encoding of a file, across all chunk sizes
     * @return false if the file is unknown or had nothing cached in it
     */
    bool clear_encoding(const std::string& file_id, Encoding encoding);

    /**
     * Take a shared hold on a file
     * @return nullopt if the file is unknown or was removed meanwhile
     */
    std::optional<FileLease> acquire(const std::string& file_id);

    std::vector<FileRecord> list() const;
    std::set<std::string> file_ids() const;
    size_t size() const;

    static std::string make_file_id(const std::string& canonical_path, uint64_t size, int64_t mtime);

private:
    CacheStore& store_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, FileRecord> records_;
    std::map<std::string, std::shared_ptr<std::shared_mutex>> gates_;

    std::shared_ptr<std::shared_mutex> gate_for(const std::string& file_id);
    std::optional<FileRecord> stat_file(const std::string& path) const;
};

} // namespace encache

#endif // FILE_REGISTRY_HPP
