#include "compression.hpp"
#include <iostream>
#include <lz4.h>
#include <lz4hc.h>
#include <zstd.h>

namespace encache {

namespace {

std::optional<std::vector<uint8_t>> compress_zstd(const std::string& data, int level) {
    size_t max_dst_size = ZSTD_compressBound(data.size());
    std::vector<uint8_t> compressed(max_dst_size);

    size_t compressed_size = ZSTD_compress(
        compressed.data(),
        max_dst_size,
        data.data(),
        data.size(),
        level
    );

    if (ZSTD_isError(compressed_size)) {
        std::cerr << "ZSTD compression failed: " << ZSTD_getErrorName(compressed_size) << std::endl;
        return std::nullopt;
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::optional<std::vector<uint8_t>> compress_lz4(const std::string& data, bool high) {
    int max_dst_size = LZ4_compressBound(static_cast<int>(data.size()));
    std::vector<uint8_t> compressed(max_dst_size);

    int compressed_size = high
        ? LZ4_compress_HC(data.data(),
                          reinterpret_cast<char*>(compressed.data()),
                          static_cast<int>(data.size()),
                          max_dst_size,
                          LZ4HC_CLEVEL_MAX)
        : LZ4_compress_default(data.data(),
                               reinterpret_cast<char*>(compressed.data()),
                               static_cast<int>(data.size()),
                               max_dst_size);

    if (compressed_size <= 0) {
        std::cerr << (high ? "LZ4 HC" : "LZ4") << " compression failed" << std::endl;
        return std::nullopt;
    }

    compressed.resize(compressed_size);
    return compressed;
}

} // namespace

std::optional<std::vector<uint8_t>> compress_with_algo(const std::string& data, CompressionAlgo algo) {
    switch (algo) {
        case CompressionAlgo::NONE:
            return std::vector<uint8_t>(data.begin(), data.end());
        case CompressionAlgo::LZ4_FAST:
            return compress_lz4(data, false);
        case CompressionAlgo::LZ4_HIGH:
            return compress_lz4(data, true);
        case CompressionAlgo::ZSTD_FAST:
            return compress_zstd(data, 3);
        case CompressionAlgo::ZSTD_MEDIUM:
            return compress_zstd(data, 10);
        case CompressionAlgo::ZSTD_MAX:
            return compress_zstd(data, 19);
    }
    return std::nullopt;
}

std::optional<std::string> decompress_with_algo(const std::vector<uint8_t>& data,
                                                CompressionAlgo algo,
                                                size_t original_size) {
    switch (algo) {
        case CompressionAlgo::NONE:
            if (data.size() != original_size) {
                return std::nullopt;
            }
            return std::string(data.begin(), data.end());

        case CompressionAlgo::LZ4_FAST:
        case CompressionAlgo::LZ4_HIGH: {
            std::string decompressed(original_size, '\0');

            int result = LZ4_decompress_safe(
                reinterpret_cast<const char*>(data.data()),
                &decompressed[0],
                static_cast<int>(data.size()),
                static_cast<int>(original_size)
            );

            if (result < 0 || static_cast<size_t>(result) != original_size) {
                std::cerr << "LZ4 decompression failed" << std::endl;
                return std::nullopt;
            }
            return decompressed;
        }

        case CompressionAlgo::ZSTD_FAST:
        case CompressionAlgo::ZSTD_MEDIUM:
        case CompressionAlgo::ZSTD_MAX: {
            std::string decompressed(original_size, '\0');

            size_t result = ZSTD_decompress(
                &decompressed[0],
                original_size,
                data.data(),
                data.size()
            );

            if (ZSTD_isError(result)) {
                std::cerr << "ZSTD decompression failed: " << ZSTD_getErrorName(result) << std::endl;
                return std::nullopt;
            }
            if (result != original_size) {
                std::cerr << "ZSTD decompression size mismatch" << std::endl;
                return std::nullopt;
            }
            return decompressed;
        }
    }
    return std::nullopt;
}

const char* compression_name(CompressionAlgo algo) {
    switch (algo) {
        case CompressionAlgo::NONE: return "none";
        case CompressionAlgo::LZ4_FAST: return "lz4";
        case CompressionAlgo::LZ4_HIGH: return "lz4hc";
        case CompressionAlgo::ZSTD_FAST: return "zstd-fast";
        case CompressionAlgo::ZSTD_MEDIUM: return "zstd";
        case CompressionAlgo::ZSTD_MAX: return "zstd-max";
    }
    return "unknown";
}

std::optional<CompressionAlgo> parse_compression(const std::string& name) {
    if (name == "none") return CompressionAlgo::NONE;
    if (name == "lz4") return CompressionAlgo::LZ4_FAST;
    if (name == "lz4hc") return CompressionAlgo::LZ4_HIGH;
    if (name == "zstd-fast") return CompressionAlgo::ZSTD_FAST;
    if (name == "zstd") return CompressionAlgo::ZSTD_MEDIUM;
    if (name == "zstd-max") return CompressionAlgo::ZSTD_MAX;
    return std::nullopt;
}

} // namespace encache
