#ifndef CHUNK_PLANNER_HPP
#define CHUNK_PLANNER_HPP

#include "encoding_codec.hpp"
#include <string>
#include <map>
#include <deque>
#include <tuple>
#include <mutex>
#include <cstdint>
#include <optional>

namespace encache {

/**
 * Raw byte range consumed to produce one encoded chunk
 */
struct ChunkPlan {
    uint32_t chunk_index;
    uint64_t offset;        // Inclusive
    uint64_t length;        // Raw bytes to read
    bool is_last;

    ChunkPlan();
};

/**
 * Window layout of one file under one encoding and target size
 */
struct ChunkLayout {
    Encoding encoding;
    uint64_t file_size;
    uint64_t target_size;       // Target encoded bytes per chunk
    uint64_t raw_window;        // Raw bytes per chunk (last chunk may be shorter)
    uint32_t total_chunks;      // Always >= 1

    ChunkLayout();
};

/**
 * Chunk planner
 *
 * Every chunk's raw window is derived from the target size alone, never from
 * the bytes earlier chunks produced, so chunk i starts at i * raw_window and
 * planning is O(1) once a layout is known. Layouts are memoized per file, up
 * to max_layouts entries; the oldest key is evicted past that.
 */
class ChunkPlanner {
public:
    static constexpr size_t kDefaultMaxLayouts = 4096;

    ChunkPlanner(uint64_t min_target = 1024, uint64_t max_target = 10 * 1024 * 1024,
                 size_t max_layouts = kDefaultMaxLayouts);

    /**
     * Whether a target encoded chunk size is within the configured bounds
     */
    bool accepts_target(uint64_t target_size) const;

    uint64_t min_target() const { return min_target_; }
    uint64_t max_target() const { return max_target_; }

    /**
     * Raw window for a target encoded size:
     * floor(target / ratio), rounded down to the codec alignment, at least one
     * alignment unit.
     */
    static uint64_t raw_window_for(Encoding encoding, uint64_t target_size);

    /**
     * Compute a layout without touching the memo
     */
    static ChunkLayout compute_layout(Encoding encoding, uint64_t file_size, uint64_t target_size);

    /**
     * Memoized layout for a file
     */
    ChunkLayout layout_for(const std::string& file_id, Encoding encoding,
                           uint64_t file_size, uint64_t target_size);

    /**
     * Plan for one chunk
     * @return nullopt if chunk_index is past the end of the layout
     */
    std::optional<ChunkPlan> plan(const ChunkLayout& layout, uint32_t chunk_index) const;

    /**
     * Check that the windows of a layout tile the file exactly
     */
    static bool verify_layout(const ChunkLayout& layout);

    /**
     * Drop memoized layouts of a removed file
     */
    void forget_file(const std::string& file_id);

    size_t memoized_layouts() const;

private:
    using LayoutKey = std::tuple<std::string, Encoding, uint64_t, uint64_t>;

    uint64_t min_target_;
    uint64_t max_target_;
    size_t max_layouts_;

    mutable std::mutex mutex_;
    std::map<LayoutKey, ChunkLayout> layouts_;
    std::deque<LayoutKey> insertion_order_;
};

} // namespace encache

#endif // CHUNK_PLANNER_HPP
