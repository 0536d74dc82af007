// ==================== Command Line Tests ====================

#include <gtest/gtest.h>
#include "cli.hpp"
#include <stdexcept>

using namespace encache;

TEST(CliTest, DefaultsWithoutArguments) {
    ServerOptions opts = parse_args({});
    EXPECT_EQ(opts.host, "0.0.0.0");
    EXPECT_EQ(opts.port, 8000);
    EXPECT_GE(opts.threads, 2u);
    EXPECT_FALSE(opts.show_help);
    EXPECT_EQ(opts.cache.input_dir, "input_files");
    EXPECT_EQ(opts.cache.default_chunk_size, 1048576u);
    EXPECT_EQ(opts.cache.default_encoding, Encoding::BASE64);
    EXPECT_EQ(opts.cache.cache_compression, CompressionAlgo::LZ4_FAST);
}

TEST(CliTest, ParsesEveryOption) {
    ServerOptions opts = parse_args({
        "-i", "/srv/in", "--cache", "/srv/cache", "--host", "127.0.0.1", "-p", "9090",
        "--threads", "3", "--chunk-size", "4096", "-e", "ascii85", "--compression", "zstd",
        "--hex-uppercase", "--no-prune", "--no-rescan"
    });
    EXPECT_EQ(opts.cache.input_dir, "/srv/in");
    EXPECT_EQ(opts.cache.cache_dir, "/srv/cache");
    EXPECT_EQ(opts.host, "127.0.0.1");
    EXPECT_EQ(opts.port, 9090);
    EXPECT_EQ(opts.threads, 3u);
    EXPECT_EQ(opts.cache.default_chunk_size, 4096u);
    EXPECT_EQ(opts.cache.default_encoding, Encoding::BASE85);
    EXPECT_EQ(opts.cache.cache_compression, CompressionAlgo::ZSTD_MEDIUM);
    EXPECT_TRUE(opts.cache.hex_uppercase);
    EXPECT_FALSE(opts.cache.prune_orphans_on_start);
    EXPECT_FALSE(opts.cache.rescan_on_list);
}

TEST(CliTest, PresetKeepsDirectoriesAndLaterFlagsWin) {
    ServerOptions opts = parse_args({"--input", "in", "--preset", "low-disk"});
    EXPECT_EQ(opts.cache.input_dir, "in");
    EXPECT_EQ(opts.cache.cache_compression, CompressionAlgo::ZSTD_MAX);

    opts = parse_args({"--preset", "throughput", "--compression", "lz4hc"});
    EXPECT_EQ(opts.cache.cache_compression, CompressionAlgo::LZ4_HIGH);
    EXPECT_FALSE(opts.cache.rescan_on_list);
}

TEST(CliTest, HelpSkipsValidation) {
    ServerOptions opts = parse_args({"--chunk-size", "1", "--help"});
    EXPECT_TRUE(opts.show_help);
    EXPECT_NE(usage().find("--chunk-size"), std::string::npos);
}

TEST(CliTest, RejectsBadArguments) {
    EXPECT_THROW(parse_args({"--bogus"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--port"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--port", "70000"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--port", "-1"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--threads", "0"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--chunk-size", "512"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--chunk-size", "20000000"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--encoding", "rot13"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--compression", "gzip"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--preset", "fastest"}), std::runtime_error);
    EXPECT_THROW(parse_args({"--input", ""}), std::runtime_error);
}
