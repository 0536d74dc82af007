#include "info_service.hpp"
#include "cache_store.hpp"
#include "chunk_planner.hpp"
#include "file_registry.hpp"

namespace encache {

FileInfo::FileInfo()
    : success(false)
    , error(ErrorCode::NONE)
    , original_size(0)
    , encoding(Encoding::BASE64)
    , chunk_size(0)
    , total_chunks(0)
    , cached_chunks(0)
    , encoded_size(0)
    , is_processed(false) {
}

InfoService::InfoService(FileRegistry& registry, CacheStore& store, ChunkPlanner& planner)
    : registry_(registry)
    , store_(store)
    , planner_(planner) {
}

FileInfo InfoService::get_info(const std::string& file_id, Encoding encoding, uint64_t chunk_size) {
    FileInfo info;
    info.file_id = file_id;
    info.encoding = encoding;
    info.chunk_size = chunk_size;

    if (!planner_.accepts_target(chunk_size)) {
        info.error = ErrorCode::INVALID_CHUNK_SIZE;
        info.message = "chunk_size must be between " + std::to_string(planner_.min_target()) +
                       " and " + std::to_string(planner_.max_target()) + " bytes";
        return info;
    }

    auto record = registry_.lookup(file_id);
    if (!record) {
        info.error = ErrorCode::FILE_NOT_FOUND;
        info.message = "File not found: " + file_id;
        return info;
    }
    info.filename = record->filename;
    info.original_size = record->original_size;

    CacheKey key(file_id, encoding, chunk_size);
    // Metadata queries do not grow the layout memo
    ChunkLayout layout = ChunkPlanner::compute_layout(encoding, record->original_size, chunk_size);
    info.cached_chunks = store_.count(key);

    // Processed means every planned index, through the EOF chunk, is on disk
    auto last = store_.last_index(key);
    if (info.cached_chunks == layout.total_chunks && last && *last + 1 == layout.total_chunks) {
        info.total_chunks = layout.total_chunks;
        info.encoded_size = store_.encoded_bytes(key);
        info.is_processed = true;
    } else {
        info.total_chunks = estimate_chunk_count(encoding, record->original_size, chunk_size);
        info.encoded_size = estimate_encoded_size(encoding, record->original_size);
        info.is_processed = false;
    }

    info.success = true;
    return info;
}

uint32_t InfoService::estimate_chunk_count(Encoding encoding, uint64_t original_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 1;
    }
    const EncodingProfile& profile = get_profile(encoding);
    uint64_t numerator = original_size * profile.ratio_num;
    uint64_t denominator = chunk_size * profile.ratio_den;
    uint64_t chunks = (numerator + denominator - 1) / denominator;
    return chunks == 0 ? 1 : static_cast<uint32_t>(chunks);
}

} // namespace encache
