// ==================== File Registry Tests ====================

#include <gtest/gtest.h>
#include "cache_store.hpp"
#include "file_registry.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>

using namespace encache;
namespace fs = std::filesystem;

class FileRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<encache_test::TempDir>();
        fs::create_directories(input());
        store_ = std::make_unique<CacheStore>(dir_->sub("cache"));
        registry_ = std::make_unique<FileRegistry>(*store_);
    }

    void TearDown() override {
        registry_.reset();
        store_.reset();
        dir_.reset();
    }

    std::string input() const { return dir_->sub("input"); }
    std::string input_file(const std::string& name) const { return input() + "/" + name; }

    std::unique_ptr<encache_test::TempDir> dir_;
    std::unique_ptr<CacheStore> store_;
    std::unique_ptr<FileRegistry> registry_;
};

TEST_F(FileRegistryTest, ScanRegistersVisibleRegularFiles) {
    encache_test::write_file(input_file("b.bin"), encache_test::random_bytes(100));
    encache_test::write_file(input_file("a.txt"), std::string("hello"));
    encache_test::write_file(input_file(".hidden"), std::string("secret"));
    fs::create_directories(input_file("subdir"));
    encache_test::write_file(input_file("subdir/nested.txt"), std::string("nested"));

    auto found = registry_->scan(input());
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].filename, "a.txt");
    EXPECT_EQ(found[0].original_size, 5u);
    EXPECT_EQ(found[1].filename, "b.bin");
    EXPECT_EQ(found[1].original_size, 100u);
    EXPECT_EQ(registry_->size(), 2u);

    for (const FileRecord& record : found) {
        EXPECT_EQ(record.file_id.size(), 16u);
        EXPECT_EQ(record.file_id.find_first_not_of("0123456789abcdef"), std::string::npos);
        EXPECT_TRUE(fs::path(record.path).is_absolute());
        auto looked_up = registry_->lookup(record.file_id);
        ASSERT_TRUE(looked_up.has_value());
        EXPECT_EQ(looked_up->path, record.path);
    }
}

TEST_F(FileRegistryTest, IdsAreStableAcrossRescansAndRegistries) {
    encache_test::write_file(input_file("stable.bin"), encache_test::random_bytes(1000));

    auto first = registry_->scan(input());
    auto second = registry_->scan(input());
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].file_id, second[0].file_id);

    // A fresh registry (a restart) derives the same id
    FileRegistry restarted(*store_);
    auto third = restarted.scan(input());
    ASSERT_EQ(third.size(), 1u);
    EXPECT_EQ(third[0].file_id, first[0].file_id);
}

TEST_F(FileRegistryTest, MakeFileIdDependsOnEveryField) {
    std::string id = FileRegistry::make_file_id("/data/a.bin", 100, 5);
    EXPECT_EQ(id, FileRegistry::make_file_id("/data/a.bin", 100, 5));
    EXPECT_NE(id, FileRegistry::make_file_id("/data/b.bin", 100, 5));
    EXPECT_NE(id, FileRegistry::make_file_id("/data/a.bin", 101, 5));
    EXPECT_NE(id, FileRegistry::make_file_id("/data/a.bin", 100, 6));
}

TEST_F(FileRegistryTest, ChangedAndVanishedFilesAreDropped) {
    encache_test::write_file(input_file("changes.bin"), encache_test::random_bytes(100));
    encache_test::write_file(input_file("vanishes.bin"), encache_test::random_bytes(200));
    auto found = registry_->scan(input());
    ASSERT_EQ(found.size(), 2u);
    std::string changed_id = found[0].file_id;
    std::string vanished_id = found[1].file_id;

    store_->put(CacheKey(changed_id, Encoding::BASE64, 1024), 0, "cached");
    store_->put(CacheKey(vanished_id, Encoding::HEX, 1024), 0, "cached");

    encache_test::write_file(input_file("changes.bin"), encache_test::random_bytes(150));
    fs::remove(input_file("vanishes.bin"));

    auto rescanned = registry_->scan(input());
    ASSERT_EQ(rescanned.size(), 1u);
    EXPECT_NE(rescanned[0].file_id, changed_id);
    EXPECT_EQ(rescanned[0].original_size, 150u);

    EXPECT_FALSE(registry_->lookup(changed_id).has_value());
    EXPECT_FALSE(registry_->lookup(vanished_id).has_value());
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_TRUE(store_->cached_file_ids().empty());
}

TEST_F(FileRegistryTest, RemoveClearsEveryEncoding) {
    encache_test::write_file(input_file("doomed.bin"), encache_test::random_bytes(64));
    std::string file_id = registry_->scan(input())[0].file_id;

    store_->put(CacheKey(file_id, Encoding::BASE64, 1024), 0, "a");
    store_->put(CacheKey(file_id, Encoding::YENC, 1024), 0, "b");
    store_->put(CacheKey(file_id, Encoding::HEX, 4096), 0, "c");

    EXPECT_EQ(registry_->remove(file_id), ErrorCode::NONE);
    EXPECT_FALSE(registry_->lookup(file_id).has_value());
    EXPECT_FALSE(registry_->acquire(file_id).has_value());
    EXPECT_TRUE(store_->cached_file_ids().empty());

    EXPECT_EQ(registry_->remove(file_id), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(registry_->remove("0000000000000000"), ErrorCode::FILE_NOT_FOUND);
}

namespace {

// Store whose cache deletion always fails
class UndeletableStore : public CacheStore {
public:
    using CacheStore::CacheStore;

    ErrorCode clear_file(const std::string&) override {
        return ErrorCode::CACHE_WRITE_FAILURE;
    }
};

} // namespace

TEST_F(FileRegistryTest, FailedCacheDeletionKeepsTheRecord) {
    UndeletableStore store(dir_->sub("stuck_cache"));
    FileRegistry registry(store);
    encache_test::write_file(input_file("stuck.bin"), encache_test::random_bytes(64));
    std::string file_id = registry.scan(input())[0].file_id;
    ASSERT_EQ(store.put(CacheKey(file_id, Encoding::BASE64, 1024), 0, "a"), ErrorCode::NONE);

    EXPECT_EQ(registry.remove(file_id), ErrorCode::CACHE_WRITE_FAILURE);
    EXPECT_TRUE(registry.lookup(file_id).has_value());
    EXPECT_TRUE(registry.acquire(file_id).has_value());
    EXPECT_TRUE(store.exists(CacheKey(file_id, Encoding::BASE64, 1024), 0));

    // A vanished file whose cache cannot be deleted stays listed
    fs::remove(input_file("stuck.bin"));
    registry.scan(input());
    EXPECT_TRUE(registry.lookup(file_id).has_value());
}

TEST_F(FileRegistryTest, ClearEncodingKeepsTheRecord) {
    encache_test::write_file(input_file("partial.bin"), encache_test::random_bytes(64));
    std::string file_id = registry_->scan(input())[0].file_id;
    store_->put(CacheKey(file_id, Encoding::BASE64, 1024), 0, "a");
    store_->put(CacheKey(file_id, Encoding::HEX, 1024), 0, "b");

    EXPECT_TRUE(registry_->clear_encoding(file_id, Encoding::HEX));
    EXPECT_TRUE(registry_->lookup(file_id).has_value());
    EXPECT_EQ(store_->count(CacheKey(file_id, Encoding::HEX, 1024)), 0u);
    EXPECT_EQ(store_->count(CacheKey(file_id, Encoding::BASE64, 1024)), 1u);

    EXPECT_FALSE(registry_->clear_encoding("0000000000000000", Encoding::HEX));
}

TEST_F(FileRegistryTest, RemoveWaitsForLeases) {
    encache_test::write_file(input_file("leased.bin"), encache_test::random_bytes(64));
    std::string file_id = registry_->scan(input())[0].file_id;

    auto lease = registry_->acquire(file_id);
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->record().file_id, file_id);

    // Leases are shared
    auto second = registry_->acquire(file_id);
    ASSERT_TRUE(second.has_value());
    second.reset();

    std::atomic<bool> removed{false};
    std::thread remover([&]() {
        removed = registry_->remove(file_id) == ErrorCode::NONE;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_FALSE(removed.load());
    EXPECT_TRUE(registry_->lookup(file_id).has_value());

    lease.reset();
    remover.join();
    EXPECT_TRUE(removed.load());
    EXPECT_FALSE(registry_->lookup(file_id).has_value());
}

TEST_F(FileRegistryTest, RegisterSingleFile) {
    encache_test::write_file(input_file("upload.bin"), encache_test::random_bytes(10));
    auto record = registry_->register_file(input_file("upload.bin"));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->filename, "upload.bin");
    EXPECT_EQ(registry_->list().size(), 1u);

    EXPECT_FALSE(registry_->register_file(input_file("missing.bin")).has_value());
    EXPECT_FALSE(registry_->register_file(input()).has_value());
}
