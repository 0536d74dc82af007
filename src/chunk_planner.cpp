#include "chunk_planner.hpp"
#include <algorithm>

namespace encache {

// ==================== ChunkPlan ====================

ChunkPlan::ChunkPlan()
    : chunk_index(0)
    , offset(0)
    , length(0)
    , is_last(false) {
}

// ==================== ChunkLayout ====================

ChunkLayout::ChunkLayout()
    : encoding(Encoding::BASE64)
    , file_size(0)
    , target_size(0)
    , raw_window(0)
    , total_chunks(1) {
}

// ==================== ChunkPlanner ====================

ChunkPlanner::ChunkPlanner(uint64_t min_target, uint64_t max_target, size_t max_layouts)
    : min_target_(min_target)
    , max_target_(max_target)
    , max_layouts_(max_layouts == 0 ? 1 : max_layouts) {
}

bool ChunkPlanner::accepts_target(uint64_t target_size) const {
    return target_size >= min_target_ && target_size <= max_target_;
}

uint64_t ChunkPlanner::raw_window_for(Encoding encoding, uint64_t target_size) {
    const EncodingProfile& profile = get_profile(encoding);
    uint64_t window = target_size * profile.ratio_den / profile.ratio_num;
    window -= window % profile.raw_alignment;
    if (window < profile.raw_alignment) {
        window = profile.raw_alignment;
    }
    return window;
}

ChunkLayout ChunkPlanner::compute_layout(Encoding encoding, uint64_t file_size, uint64_t target_size) {
    ChunkLayout layout;
    layout.encoding = encoding;
    layout.file_size = file_size;
    layout.target_size = target_size;
    layout.raw_window = raw_window_for(encoding, target_size);

    // An empty file still has one (empty) chunk
    uint64_t chunks = (file_size + layout.raw_window - 1) / layout.raw_window;
    layout.total_chunks = chunks == 0 ? 1 : static_cast<uint32_t>(chunks);
    return layout;
}

ChunkLayout ChunkPlanner::layout_for(const std::string& file_id, Encoding encoding,
                                     uint64_t file_size, uint64_t target_size) {
    LayoutKey key(file_id, encoding, file_size, target_size);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = layouts_.find(key);
    if (it != layouts_.end()) {
        return it->second;
    }

    ChunkLayout layout = compute_layout(encoding, file_size, target_size);
    while (layouts_.size() >= max_layouts_ && !insertion_order_.empty()) {
        layouts_.erase(insertion_order_.front());
        insertion_order_.pop_front();
    }
    layouts_[key] = layout;
    insertion_order_.push_back(key);
    return layout;
}

std::optional<ChunkPlan> ChunkPlanner::plan(const ChunkLayout& layout, uint32_t chunk_index) const {
    if (chunk_index >= layout.total_chunks) {
        return std::nullopt;
    }

    ChunkPlan plan;
    plan.chunk_index = chunk_index;
    plan.offset = static_cast<uint64_t>(chunk_index) * layout.raw_window;
    plan.is_last = (chunk_index + 1 == layout.total_chunks);
    plan.length = plan.is_last ? layout.file_size - plan.offset : layout.raw_window;
    return plan;
}

bool ChunkPlanner::verify_layout(const ChunkLayout& layout) {
    if (layout.raw_window == 0 || layout.total_chunks == 0) {
        return false;
    }
    if (layout.file_size == 0) {
        return layout.total_chunks == 1;
    }

    uint64_t last_offset = static_cast<uint64_t>(layout.total_chunks - 1) * layout.raw_window;
    if (last_offset >= layout.file_size) {
        return false;
    }
    return layout.file_size - last_offset <= layout.raw_window;
}

void ChunkPlanner::forget_file(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = layouts_.begin(); it != layouts_.end();) {
        if (std::get<0>(it->first) == file_id) {
            it = layouts_.erase(it);
        } else {
            ++it;
        }
    }
    insertion_order_.erase(
        std::remove_if(insertion_order_.begin(), insertion_order_.end(),
                       [&](const LayoutKey& key) { return std::get<0>(key) == file_id; }),
        insertion_order_.end());
}

size_t ChunkPlanner::memoized_layouts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return layouts_.size();
}

} // namespace encache
