// ==================== Chunk Service Tests ====================

#include <gtest/gtest.h>
#include "cache_store.hpp"
#include "chunk_planner.hpp"
#include "chunk_service.hpp"
#include "file_registry.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using namespace encache;
namespace fs = std::filesystem;

class ChunkServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<encache_test::TempDir>();
        fs::create_directories(dir_->sub("input"));
        store_ = std::make_unique<CacheStore>(dir_->sub("cache"), CompressionAlgo::LZ4_FAST);
        registry_ = std::make_unique<FileRegistry>(*store_);
        planner_ = std::make_unique<ChunkPlanner>();
        service_ = std::make_unique<ChunkService>(*registry_, *store_, *planner_);
    }

    void TearDown() override {
        service_.reset();
        planner_.reset();
        registry_.reset();
        store_.reset();
        dir_.reset();
    }

    std::string add_file(const std::string& name, const std::vector<uint8_t>& data) {
        std::string path = dir_->sub("input/" + name);
        encache_test::write_file(path, data);
        auto record = registry_->register_file(path);
        EXPECT_TRUE(record.has_value());
        return record ? record->file_id : std::string();
    }

    std::string input_path(const std::string& name) const { return dir_->sub("input/" + name); }

    std::unique_ptr<encache_test::TempDir> dir_;
    std::unique_ptr<CacheStore> store_;
    std::unique_ptr<FileRegistry> registry_;
    std::unique_ptr<ChunkPlanner> planner_;
    std::unique_ptr<ChunkService> service_;
};

TEST_F(ChunkServiceTest, SmallFileIsOneChunk) {
    std::string file_id = add_file("abc.bin", {0x41, 0x42, 0x43});

    ChunkResult base64 = service_->get_chunk(file_id, Encoding::BASE64, 0, 1024);
    ASSERT_TRUE(base64.success) << base64.message;
    EXPECT_EQ(base64.data, "QUJD");
    EXPECT_EQ(base64.total_chunks, 1u);
    EXPECT_TRUE(base64.is_last);
    EXPECT_FALSE(base64.from_cache);
    EXPECT_EQ(base64.raw_offset, 0u);
    EXPECT_EQ(base64.raw_length, 3u);

    ChunkResult yenc = service_->get_chunk(file_id, Encoding::YENC, 0, 1024);
    ASSERT_TRUE(yenc.success) << yenc.message;
    EXPECT_EQ(yenc.data, "klm");
    EXPECT_EQ(yenc.total_chunks, 1u);
}

TEST_F(ChunkServiceTest, SecondRequestIsServedFromCache) {
    std::vector<uint8_t> data = encache_test::random_bytes(5000, 11);
    std::string file_id = add_file("data.bin", data);

    ChunkResult first = service_->get_chunk(file_id, Encoding::HEX, 1, 1024);
    ASSERT_TRUE(first.success) << first.message;
    EXPECT_FALSE(first.from_cache);
    EXPECT_EQ(service_->encode_operations(), 1u);
    EXPECT_EQ(service_->cache_hits(), 0u);

    ChunkResult second = service_->get_chunk(file_id, Encoding::HEX, 1, 1024);
    ASSERT_TRUE(second.success);
    EXPECT_TRUE(second.from_cache);
    EXPECT_EQ(second.data, first.data);
    EXPECT_EQ(service_->encode_operations(), 1u);
    EXPECT_EQ(service_->cache_hits(), 1u);

    // Same bytes in another encoding are a separate cache area
    ChunkResult other = service_->get_chunk(file_id, Encoding::BASE64, 1, 1024);
    ASSERT_TRUE(other.success);
    EXPECT_FALSE(other.from_cache);
    EXPECT_EQ(service_->encode_operations(), 2u);
    EXPECT_EQ(service_->in_flight(), 0u);
}

TEST_F(ChunkServiceTest, ChunksReassembleToWholeFileEncoding) {
    std::vector<uint8_t> data = encache_test::random_bytes(30011, 17);
    std::string file_id = add_file("whole.bin", data);

    for (Encoding encoding : all_encodings()) {
        std::string joined;
        uint32_t total = 1;
        for (uint32_t i = 0; i < total; i++) {
            ChunkResult chunk = service_->get_chunk(file_id, encoding, i, 2048);
            ASSERT_TRUE(chunk.success) << encoding_name(encoding) << ": " << chunk.message;
            total = chunk.total_chunks;
            EXPECT_EQ(chunk.is_last, i + 1 == total);
            if (get_profile(encoding).fixed_ratio) {
                EXPECT_LE(chunk.data.size(), 2048u) << encoding_name(encoding);
            }
            joined += chunk.data;
        }
        EXPECT_GT(total, 1u) << encoding_name(encoding);
        EXPECT_EQ(joined, encode(encoding, data)) << encoding_name(encoding);

        DecodeResult decoded = decode(encoding, joined);
        ASSERT_TRUE(decoded.success) << decoded.message;
        EXPECT_TRUE(decoded.data == data) << encoding_name(encoding);
    }
}

TEST_F(ChunkServiceTest, EmptyFileHasOneEmptyChunk) {
    std::string file_id = add_file("empty.bin", {});

    ChunkResult chunk = service_->get_chunk(file_id, Encoding::BASE32, 0, 1024);
    ASSERT_TRUE(chunk.success) << chunk.message;
    EXPECT_TRUE(chunk.data.empty());
    EXPECT_EQ(chunk.total_chunks, 1u);
    EXPECT_TRUE(chunk.is_last);

    ChunkResult past = service_->get_chunk(file_id, Encoding::BASE32, 1, 1024);
    EXPECT_FALSE(past.success);
    EXPECT_EQ(past.error, ErrorCode::CHUNK_INDEX_OUT_OF_RANGE);
}

TEST_F(ChunkServiceTest, RequestErrors) {
    std::string file_id = add_file("errors.bin", encache_test::random_bytes(2000));

    ChunkResult unknown = service_->get_chunk("ffffffffffffffff", Encoding::BASE64, 0, 1024);
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error, ErrorCode::FILE_NOT_FOUND);

    // 2000 raw bytes at 768 per chunk: indices 0..2
    ChunkResult out_of_range = service_->get_chunk(file_id, Encoding::BASE64, 3, 1024);
    EXPECT_FALSE(out_of_range.success);
    EXPECT_EQ(out_of_range.error, ErrorCode::CHUNK_INDEX_OUT_OF_RANGE);
    EXPECT_EQ(out_of_range.total_chunks, 3u);

    ChunkResult too_small = service_->get_chunk(file_id, Encoding::BASE64, 0, 1023);
    EXPECT_EQ(too_small.error, ErrorCode::INVALID_CHUNK_SIZE);
    ChunkResult too_large = service_->get_chunk(file_id, Encoding::BASE64, 0, 10485761);
    EXPECT_EQ(too_large.error, ErrorCode::INVALID_CHUNK_SIZE);

    // Failed requests leave nothing behind
    EXPECT_EQ(service_->encode_operations(), 0u);
    EXPECT_TRUE(store_->cached_file_ids().empty());
}

TEST_F(ChunkServiceTest, ConcurrentRequestsEncodeOnce) {
    std::vector<uint8_t> data = encache_test::random_bytes(3 * 1024 * 1024, 23);
    std::string file_id = add_file("busy.bin", data);

    const int kThreads = 8;
    std::vector<ChunkResult> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&, t]() {
            results[t] = service_->get_chunk(file_id, Encoding::BASE85, 0, 1048576);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(service_->encode_operations(), 1u);
    EXPECT_EQ(service_->cache_hits(), static_cast<uint64_t>(kThreads - 1));
    for (const ChunkResult& result : results) {
        ASSERT_TRUE(result.success) << result.message;
        EXPECT_EQ(result.data, results[0].data);
    }
    EXPECT_EQ(service_->in_flight(), 0u);
}

TEST_F(ChunkServiceTest, DifferentChunksProducedInParallel) {
    std::vector<uint8_t> data = encache_test::random_bytes(200000, 29);
    std::string file_id = add_file("parallel.bin", data);

    // 200000 raw bytes at 2048 raw bytes per hex chunk
    const uint32_t total = 98;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (uint32_t i = t; i < total; i += 4) {
                ChunkResult chunk = service_->get_chunk(file_id, Encoding::HEX, i, 4096);
                EXPECT_TRUE(chunk.success) << chunk.message;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(service_->encode_operations(), total);
    EXPECT_EQ(store_->count(CacheKey(file_id, Encoding::HEX, 4096)), total);
}

TEST_F(ChunkServiceTest, ShrunkSourceIsAPlanningInconsistency) {
    std::string file_id = add_file("shrinks.bin", encache_test::random_bytes(5000));
    fs::resize_file(input_path("shrinks.bin"), 100);

    ChunkResult chunk = service_->get_chunk(file_id, Encoding::BASE64, 1, 1024);
    EXPECT_FALSE(chunk.success);
    EXPECT_EQ(chunk.error, ErrorCode::PLANNING_INCONSISTENCY);
    EXPECT_FALSE(store_->exists(CacheKey(file_id, Encoding::BASE64, 1024), 1));
}

TEST_F(ChunkServiceTest, MissingSourceIsAnIoFailure) {
    std::string file_id = add_file("vanishes.bin", encache_test::random_bytes(5000));
    fs::remove(input_path("vanishes.bin"));

    ChunkResult chunk = service_->get_chunk(file_id, Encoding::BASE64, 0, 1024);
    EXPECT_FALSE(chunk.success);
    EXPECT_EQ(chunk.error, ErrorCode::IO_FAILURE);
    EXPECT_TRUE(is_retryable(chunk.error));
}

TEST_F(ChunkServiceTest, UnwritableCacheIsAWriteFailure) {
    std::string file_id = add_file("blocked.bin", encache_test::random_bytes(5000));
    encache_test::write_file(dir_->sub("cache/chunks/" + file_id), std::string("not a directory"));

    ChunkResult chunk = service_->get_chunk(file_id, Encoding::BASE64, 0, 1024);
    EXPECT_FALSE(chunk.success);
    EXPECT_EQ(chunk.error, ErrorCode::CACHE_WRITE_FAILURE);
    EXPECT_TRUE(chunk.data.empty());

    // Once the obstruction is gone the same request succeeds
    fs::remove(dir_->sub("cache/chunks/" + file_id));
    ChunkResult retry = service_->get_chunk(file_id, Encoding::BASE64, 0, 1024);
    ASSERT_TRUE(retry.success) << retry.message;
    EXPECT_EQ(retry.data.size(), 1024u);
}

TEST_F(ChunkServiceTest, RemovedFileIsNotFound) {
    std::string file_id = add_file("removed.bin", encache_test::random_bytes(5000));
    ASSERT_TRUE(service_->get_chunk(file_id, Encoding::HEX, 0, 1024).success);

    ASSERT_EQ(registry_->remove(file_id), ErrorCode::NONE);
    ChunkResult chunk = service_->get_chunk(file_id, Encoding::HEX, 0, 1024);
    EXPECT_FALSE(chunk.success);
    EXPECT_EQ(chunk.error, ErrorCode::FILE_NOT_FOUND);
    EXPECT_TRUE(store_->cached_file_ids().empty());
}
