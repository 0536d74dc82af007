#include "file_registry.hpp"
#include "cache_store.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace encache {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

uint64_t fnv1a(uint64_t hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    // Field separator so ("ab", "c") and ("a", "bc") differ
    hash ^= 0xFF;
    hash *= kFnvPrime;
    return hash;
}

} // namespace

// ==================== FileRecord ====================

FileRecord::FileRecord()
    : original_size(0)
    , mtime(0) {
}

// ==================== FileLease ====================

FileLease::FileLease(const FileRecord& record,
                     std::shared_ptr<std::shared_mutex> gate,
                     std::shared_lock<std::shared_mutex>&& hold)
    : record_(record)
    , gate_(std::move(gate))
    , hold_(std::move(hold)) {
}

// ==================== FileRegistry ====================

FileRegistry::FileRegistry(CacheStore& store)
    : store_(store) {
}

FileRegistry::~FileRegistry() = default;

std::vector<FileRecord> FileRegistry::scan(const std::string& directory) {
    std::vector<FileRecord> found;

    std::error_code ec;
    fs::path root = fs::canonical(directory, ec);
    if (ec) {
        std::cerr << "Cannot scan " << directory << ": " << ec.message() << std::endl;
        return found;
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        std::cerr << "Cannot scan " << directory << ": " << ec.message() << std::endl;
        return found;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        std::error_code type_ec;
        if (name.empty() || name[0] == '.' || !entry.is_regular_file(type_ec)) {
            continue;
        }
        auto record = stat_file(entry.path().string());
        if (record) {
            found.push_back(*record);
        }
    }

    std::set<std::string> seen;
    std::vector<std::string> stale;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const FileRecord& record : found) {
            seen.insert(record.file_id);
            if (records_.emplace(record.file_id, record).second) {
                std::cout << "Registered file: " << record.filename << " -> " << record.file_id
                          << " (" << record.original_size << " bytes)" << std::endl;
            }
        }
        for (const auto& [file_id, record] : records_) {
            if (seen.count(file_id) == 0 && fs::path(record.path).parent_path() == root) {
                stale.push_back(file_id);
            }
        }
    }

    // Vanished or modified since the last scan
    for (const std::string& file_id : stale) {
        std::cout << "Dropping stale file: " << file_id << std::endl;
        if (remove(file_id) == ErrorCode::CACHE_WRITE_FAILURE) {
            std::cerr << "Keeping stale file " << file_id << " until its cache can be deleted" << std::endl;
        }
    }

    std::sort(found.begin(), found.end(), [](const FileRecord& a, const FileRecord& b) {
        return a.filename < b.filename;
    });
    return found;
}

std::optional<FileRecord> FileRegistry::lookup(const std::string& file_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = records_.find(file_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<FileRecord> FileRegistry::register_file(const std::string& path) {
    auto record = stat_file(path);
    if (!record) {
        std::cerr << "Cannot register " << path << ": not a readable regular file" << std::endl;
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.emplace(record->file_id, *record);
    return record;
}

ErrorCode FileRegistry::remove(const std::string& file_id) {
    std::shared_ptr<std::shared_mutex> gate;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (records_.count(file_id) == 0) {
            return ErrorCode::FILE_NOT_FOUND;
        }
        gate = gate_for(file_id);
    }

    // Wait for every lease on this file to be released
    std::unique_lock<std::shared_mutex> exclusive(*gate);
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (records_.count(file_id) == 0) {
            return ErrorCode::FILE_NOT_FOUND;
        }
    }

    ErrorCode cleared = store_.clear_file(file_id);
    if (cleared != ErrorCode::NONE) {
        return cleared;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.erase(file_id);
    gates_.erase(file_id);
    return ErrorCode::NONE;
}

bool FileRegistry::clear_encoding(const std::string& file_id, Encoding encoding) {
    std::shared_ptr<std::shared_mutex> gate;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (records_.count(file_id) == 0) {
            return false;
        }
        gate = gate_for(file_id);
    }

    std::unique_lock<std::shared_mutex> exclusive(*gate);
    return store_.clear_encoding(file_id, encoding);
}

std::optional<FileLease> FileRegistry::acquire(const std::string& file_id) {
    std::shared_ptr<std::shared_mutex> gate;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (records_.count(file_id) == 0) {
            return std::nullopt;
        }
        gate = gate_for(file_id);
    }

    std::shared_lock<std::shared_mutex> hold(*gate);

    // A removal may have completed while we waited
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto record_it = records_.find(file_id);
    auto gate_it = gates_.find(file_id);
    if (record_it == records_.end() || gate_it == gates_.end() || gate_it->second != gate) {
        return std::nullopt;
    }
    return FileLease(record_it->second, gate, std::move(hold));
}

std::vector<FileRecord> FileRegistry::list() const {
    std::vector<FileRecord> records;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [file_id, record] : records_) {
            records.push_back(record);
        }
    }
    std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
        return a.filename != b.filename ? a.filename < b.filename : a.file_id < b.file_id;
    });
    return records;
}

std::set<std::string> FileRegistry::file_ids() const {
    std::set<std::string> ids;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [file_id, record] : records_) {
        ids.insert(file_id);
    }
    return ids;
}

size_t FileRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

std::string FileRegistry::make_file_id(const std::string& canonical_path, uint64_t size, int64_t mtime) {
    uint64_t hash = kFnvOffset;
    hash = fnv1a(hash, canonical_path);
    hash = fnv1a(hash, std::to_string(size));
    hash = fnv1a(hash, std::to_string(mtime));

    static const char digits[] = "0123456789abcdef";
    std::string id(16, '0');
    for (int i = 15; i >= 0; i--) {
        id[i] = digits[hash & 0x0F];
        hash >>= 4;
    }
    return id;
}

// ==================== Private Methods ====================

std::shared_ptr<std::shared_mutex> FileRegistry::gate_for(const std::string& file_id) {
    auto& gate = gates_[file_id];
    if (!gate) {
        gate = std::make_shared<std::shared_mutex>();
    }
    return gate;
}

std::optional<FileRecord> FileRegistry::stat_file(const std::string& path) const {
    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec || !fs::is_regular_file(canonical, ec)) {
        return std::nullopt;
    }

    uintmax_t size = fs::file_size(canonical, ec);
    if (ec) {
        return std::nullopt;
    }
    fs::file_time_type written = fs::last_write_time(canonical, ec);
    if (ec) {
        return std::nullopt;
    }

    FileRecord record;
    record.path = canonical.string();
    record.filename = canonical.filename().string();
    record.original_size = size;
    record.mtime = std::chrono::duration_cast<std::chrono::nanoseconds>(written.time_since_epoch()).count();
    record.file_id = make_file_id(record.path, record.original_size, record.mtime);
    return record;
}

} // namespace encache
