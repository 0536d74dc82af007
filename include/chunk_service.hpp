#ifndef CHUNK_SERVICE_HPP
#define CHUNK_SERVICE_HPP

#include "encoding_codec.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace encache {

class FileRegistry;
class CacheStore;
class ChunkPlanner;
struct ChunkPlan;

/**
 * Result of a chunk request
 */
struct ChunkResult {
    bool success;
    ErrorCode error;
    std::string message;

    std::string data;           // Encoded chunk
    Encoding encoding;
    uint64_t chunk_size;        // Target size the layout was planned for
    uint32_t chunk_index;
    uint32_t total_chunks;      // Exact planned count
    bool is_last;
    bool from_cache;
    uint64_t raw_offset;
    uint64_t raw_length;

    ChunkResult();
};

/**
 * Chunk service
 *
 * Answers "chunk N of file F in encoding E" by reading the planned raw window,
 * encoding it and writing it to the cache on first access. Later requests are
 * plain cache reads. Concurrent requests for the same chunk encode it once;
 * different chunks are produced in parallel.
 */
class ChunkService {
public:
    ChunkService(FileRegistry& registry, CacheStore& store, ChunkPlanner& planner,
                 const CodecOptions& options = CodecOptions());
    ~ChunkService();

    ChunkResult get_chunk(const std::string& file_id, Encoding encoding,
                          uint32_t chunk_index, uint64_t chunk_size);

    /**
     * Number of encodes performed since construction
     */
    uint64_t encode_operations() const { return encode_operations_.load(); }

    /**
     * Number of requests answered from the cache
     */
    uint64_t cache_hits() const { return cache_hits_.load(); }

    /**
     * Chunks currently being produced
     */
    size_t in_flight() const;

private:
    struct InFlight {
        std::shared_ptr<std::mutex> mutex;
        size_t users;

        InFlight() : users(0) {}
    };

    // Holds the per-chunk slot for the duration of a production
    class InFlightGuard {
    public:
        InFlightGuard(ChunkService& service, const std::string& chunk_key);
        ~InFlightGuard();

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

        std::mutex& mutex() { return *mutex_; }

    private:
        ChunkService& service_;
        std::string chunk_key_;
        std::shared_ptr<std::mutex> mutex_;
    };

    FileRegistry& registry_;
    CacheStore& store_;
    ChunkPlanner& planner_;
    CodecOptions options_;

    mutable std::mutex inflight_mutex_;
    std::map<std::string, InFlight> inflight_;

    std::atomic<uint64_t> encode_operations_;
    std::atomic<uint64_t> cache_hits_;

    bool read_window(const std::string& path, const ChunkPlan& plan,
                     std::vector<uint8_t>& buffer, ChunkResult& result) const;
    static void fail(ChunkResult& result, ErrorCode error, const std::string& message);
};

} // namespace encache

#endif // CHUNK_SERVICE_HPP
