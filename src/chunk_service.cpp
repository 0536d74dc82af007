#include "chunk_service.hpp"
#include "cache_store.hpp"
#include "chunk_planner.hpp"
#include "file_registry.hpp"
#include <fstream>
#include <iostream>

namespace encache {

// ==================== ChunkResult ====================

ChunkResult::ChunkResult()
    : success(false)
    , error(ErrorCode::NONE)
    , encoding(Encoding::BASE64)
    , chunk_size(0)
    , chunk_index(0)
    , total_chunks(0)
    , is_last(false)
    , from_cache(false)
    , raw_offset(0)
    , raw_length(0) {
}

// ==================== InFlightGuard ====================

ChunkService::InFlightGuard::InFlightGuard(ChunkService& service, const std::string& chunk_key)
    : service_(service)
    , chunk_key_(chunk_key) {
    std::lock_guard<std::mutex> lock(service_.inflight_mutex_);
    InFlight& slot = service_.inflight_[chunk_key_];
    if (!slot.mutex) {
        slot.mutex = std::make_shared<std::mutex>();
    }
    slot.users++;
    mutex_ = slot.mutex;
}

ChunkService::InFlightGuard::~InFlightGuard() {
    std::lock_guard<std::mutex> lock(service_.inflight_mutex_);
    auto it = service_.inflight_.find(chunk_key_);
    if (it != service_.inflight_.end() && --it->second.users == 0) {
        service_.inflight_.erase(it);
    }
}

// ==================== ChunkService ====================

ChunkService::ChunkService(FileRegistry& registry, CacheStore& store, ChunkPlanner& planner,
                           const CodecOptions& options)
    : registry_(registry)
    , store_(store)
    , planner_(planner)
    , options_(options)
    , encode_operations_(0)
    , cache_hits_(0) {
}

ChunkService::~ChunkService() = default;

ChunkResult ChunkService::get_chunk(const std::string& file_id, Encoding encoding,
                                    uint32_t chunk_index, uint64_t chunk_size) {
    ChunkResult result;
    result.encoding = encoding;
    result.chunk_size = chunk_size;
    result.chunk_index = chunk_index;

    if (!planner_.accepts_target(chunk_size)) {
        fail(result, ErrorCode::INVALID_CHUNK_SIZE,
             "chunk_size must be between " + std::to_string(planner_.min_target()) +
             " and " + std::to_string(planner_.max_target()) + " bytes");
        return result;
    }

    auto record = registry_.lookup(file_id);
    if (!record) {
        fail(result, ErrorCode::FILE_NOT_FOUND, "File not found: " + file_id);
        return result;
    }

    ChunkLayout layout = planner_.layout_for(file_id, encoding, record->original_size, chunk_size);
    if (!ChunkPlanner::verify_layout(layout)) {
        std::cerr << "Inconsistent layout for " << file_id << " (" << encoding_name(encoding)
                  << ", " << chunk_size << ")" << std::endl;
        fail(result, ErrorCode::PLANNING_INCONSISTENCY, "Chunk layout does not cover the file");
        return result;
    }
    result.total_chunks = layout.total_chunks;

    auto plan = planner_.plan(layout, chunk_index);
    if (!plan) {
        fail(result, ErrorCode::CHUNK_INDEX_OUT_OF_RANGE,
             "Chunk " + std::to_string(chunk_index) + " out of range (file has " +
             std::to_string(layout.total_chunks) + " chunks)");
        return result;
    }
    result.is_last = plan->is_last;
    result.raw_offset = plan->offset;
    result.raw_length = plan->length;

    CacheKey key(file_id, encoding, chunk_size);
    if (auto cached = store_.get(key, chunk_index)) {
        cache_hits_++;
        result.data = std::move(*cached);
        result.from_cache = true;
        result.success = true;
        return result;
    }

    // Keep the file registered until the chunk is on disk
    auto lease = registry_.acquire(file_id);
    if (!lease) {
        fail(result, ErrorCode::FILE_NOT_FOUND, "File not found: " + file_id);
        return result;
    }

    InFlightGuard guard(*this, file_id + "/" + encoding_name(encoding) + "/" +
                               std::to_string(chunk_size) + "/" + std::to_string(chunk_index));
    std::lock_guard<std::mutex> chunk_lock(guard.mutex());

    // Another request may have produced it while we waited
    if (auto cached = store_.get(key, chunk_index)) {
        cache_hits_++;
        result.data = std::move(*cached);
        result.from_cache = true;
        result.success = true;
        return result;
    }

    std::vector<uint8_t> raw;
    if (!read_window(lease->record().path, *plan, raw, result)) {
        return result;
    }

    result.data = encode(encoding, raw, options_);
    encode_operations_++;

    ErrorCode written = store_.put(key, chunk_index, result.data);
    if (written != ErrorCode::NONE) {
        result.data.clear();
        fail(result, written, "Failed to cache chunk " + std::to_string(chunk_index) + "; retry");
        return result;
    }

    result.success = true;
    return result;
}

size_t ChunkService::in_flight() const {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    return inflight_.size();
}

// ==================== Private Methods ====================

bool ChunkService::read_window(const std::string& path, const ChunkPlan& plan,
                               std::vector<uint8_t>& buffer, ChunkResult& result) const {
    std::ifstream source(path, std::ios::binary);
    if (!source) {
        std::cerr << "Failed to open source file: " << path << std::endl;
        fail(result, ErrorCode::IO_FAILURE, "Source file could not be opened");
        return false;
    }

    buffer.resize(plan.length);
    source.seekg(static_cast<std::streamoff>(plan.offset));
    source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));

    if (source.gcount() != static_cast<std::streamsize>(plan.length)) {
        // The file shrank since it was registered under this id
        std::cerr << "Short read from " << path << ": wanted " << plan.length << " bytes at offset "
                  << plan.offset << ", got " << source.gcount() << std::endl;
        fail(result, ErrorCode::PLANNING_INCONSISTENCY,
             "Source file changed since it was registered; rescan required");
        return false;
    }
    return true;
}

void ChunkService::fail(ChunkResult& result, ErrorCode error, const std::string& message) {
    result.success = false;
    result.error = error;
    result.message = message;
}

} // namespace encache
