#include "encoding_cache.hpp"
#include "cache_store.hpp"
#include "chunk_planner.hpp"
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace encache {

// ==================== CacheConfig ====================

CacheConfig::CacheConfig()
    : input_dir("input_files")
    , cache_dir("encache_cache")
    , default_chunk_size(1024 * 1024)  // 1MB of encoded output
    , min_chunk_size(1024)
    , max_chunk_size(10 * 1024 * 1024)
    , default_encoding(Encoding::BASE64)
    , cache_compression(CompressionAlgo::LZ4_FAST)
    , prune_orphans_on_start(true)
    , hex_uppercase(false)
    , rescan_on_list(true) {
}

CacheConfig CacheConfig::default_config() {
    return CacheConfig();
}

CacheConfig CacheConfig::config_for_low_disk() {
    CacheConfig config;
    // Slow first write, smallest cache
    config.cache_compression = CompressionAlgo::ZSTD_MAX;
    return config;
}

CacheConfig CacheConfig::config_for_throughput() {
    CacheConfig config;
    config.cache_compression = CompressionAlgo::NONE;
    config.rescan_on_list = false;
    return config;
}

// ==================== CacheStats ====================

CacheStats::CacheStats()
    : registered_files(0)
    , cached_files(0)
    , storage_bytes(0)
    , encode_operations(0)
    , cache_hits(0)
    , memoized_layouts(0) {
}

// ==================== EncodingCache ====================

EncodingCache::EncodingCache(const CacheConfig& config)
    : config_(config) {

    CodecOptions options;
    options.hex_uppercase = config_.hex_uppercase;

    store_ = std::make_unique<CacheStore>(config_.cache_dir, config_.cache_compression);
    planner_ = std::make_unique<ChunkPlanner>(config_.min_chunk_size, config_.max_chunk_size);
    registry_ = std::make_unique<FileRegistry>(*store_);
    chunks_ = std::make_unique<ChunkService>(*registry_, *store_, *planner_, options);
    info_ = std::make_unique<InfoService>(*registry_, *store_, *planner_);

    if (!config_.input_dir.empty()) {
        std::error_code ec;
        fs::create_directories(config_.input_dir, ec);
        if (ec) {
            std::cerr << "Failed to create input directory " << config_.input_dir
                      << ": " << ec.message() << std::endl;
        }
        rescan();
    }

    if (config_.prune_orphans_on_start) {
        size_t pruned = store_->prune_orphans(registry_->file_ids());
        if (pruned > 0) {
            std::cout << "Pruned " << pruned << " orphaned file cache(s)" << std::endl;
        }
    }
}

EncodingCache::~EncodingCache() = default;

// ==================== Files ====================

std::vector<FileRecord> EncodingCache::rescan() {
    if (config_.input_dir.empty()) {
        return {};
    }

    std::set<std::string> before = registry_->file_ids();
    std::vector<FileRecord> found = registry_->scan(config_.input_dir);
    std::set<std::string> after = registry_->file_ids();
    for (const std::string& file_id : before) {
        if (after.count(file_id) == 0) {
            planner_->forget_file(file_id);
        }
    }
    return found;
}

std::vector<FileRecord> EncodingCache::list_files() {
    if (config_.rescan_on_list) {
        rescan();
    }
    return registry_->list();
}

std::optional<FileRecord> EncodingCache::register_file(const std::string& path) {
    return registry_->register_file(path);
}

std::optional<FileRecord> EncodingCache::lookup(const std::string& file_id) const {
    return registry_->lookup(file_id);
}

ErrorCode EncodingCache::remove_file(const std::string& file_id) {
    ErrorCode removed = registry_->remove(file_id);
    if (removed != ErrorCode::NONE) {
        return removed;
    }
    planner_->forget_file(file_id);
    std::cout << "Removed file " << file_id << " and its cached chunks" << std::endl;
    return ErrorCode::NONE;
}

ErrorCode EncodingCache::clear_encoding(const std::string& file_id, Encoding encoding) {
    if (!registry_->lookup(file_id)) {
        return ErrorCode::FILE_NOT_FOUND;
    }
    if (registry_->clear_encoding(file_id, encoding)) {
        std::cout << "Cleared " << encoding_name(encoding) << " cache of " << file_id << std::endl;
    }
    return ErrorCode::NONE;
}

size_t EncodingCache::file_count() const {
    return registry_->size();
}

// ==================== Chunks ====================

ChunkResult EncodingCache::get_chunk(const std::string& file_id, Encoding encoding,
                                     uint32_t chunk_index, uint64_t chunk_size) {
    return chunks_->get_chunk(file_id, encoding, chunk_index, chunk_size);
}

FileInfo EncodingCache::get_info(const std::string& file_id, Encoding encoding, uint64_t chunk_size) {
    return info_->get_info(file_id, encoding, chunk_size);
}

// ==================== Statistics ====================

CacheStats EncodingCache::get_stats() const {
    CacheStats stats;
    stats.registered_files = registry_->size();
    stats.cached_files = store_->cached_file_ids().size();
    stats.storage_bytes = store_->get_storage_size();
    stats.encode_operations = chunks_->encode_operations();
    stats.cache_hits = chunks_->cache_hits();
    stats.memoized_layouts = planner_->memoized_layouts();
    return stats;
}

void EncodingCache::print_stats() const {
    CacheStats stats = get_stats();

    std::cout << "===== Cache Statistics =====" << std::endl;
    std::cout << "Registered files: " << stats.registered_files << std::endl;
    std::cout << "Files with cached chunks: " << stats.cached_files << std::endl;
    std::cout << "Storage on disk: " << stats.storage_bytes << " bytes" << std::endl;
    std::cout << "At-rest compression: " << compression_name(config_.cache_compression) << std::endl;
    std::cout << std::endl;
    std::cout << "Encode operations: " << stats.encode_operations << std::endl;
    std::cout << "Cache hits: " << stats.cache_hits << std::endl;
    uint64_t requests = stats.encode_operations + stats.cache_hits;
    if (requests > 0) {
        std::cout << "Hit rate: " << (100.0 * stats.cache_hits / requests) << "%" << std::endl;
    }
    std::cout << "Memoized layouts: " << stats.memoized_layouts << std::endl;
}

} // namespace encache
