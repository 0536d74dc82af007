#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace encache {

/**
 * At-rest compression applied to cached chunk payloads
 */
enum class CompressionAlgo : uint8_t {
    NONE = 0,           // Stored as produced
    LZ4_FAST = 1,       // Fastest reads, modest savings
    LZ4_HIGH = 2,       // LZ4 HC, same decode speed
    ZSTD_FAST = 3,      // ZSTD level 3
    ZSTD_MEDIUM = 4,    // ZSTD level 10
    ZSTD_MAX = 5        // ZSTD level 19
};

/**
 * Compress a payload
 * @return nullopt if the compressor reports an error
 */
std::optional<std::vector<uint8_t>> compress_with_algo(const std::string& data, CompressionAlgo algo);

/**
 * Decompress a payload back to exactly original_size bytes
 * @return nullopt on corrupt input or size mismatch
 */
std::optional<std::string> decompress_with_algo(const std::vector<uint8_t>& data,
                                                CompressionAlgo algo,
                                                size_t original_size);

/**
 * "none", "lz4", "lz4hc", "zstd-fast", "zstd", "zstd-max"
 */
const char* compression_name(CompressionAlgo algo);
std::optional<CompressionAlgo> parse_compression(const std::string& name);

} // namespace encache

#endif // COMPRESSION_HPP
