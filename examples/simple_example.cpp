#include "encoding_cache.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace encache;

int main() {
    std::cout << "=== Encoding Cache - Simple Example ===\n" << std::endl;

    // 1. Put a small source file in a fresh input directory
    std::filesystem::create_directories("example_input");
    {
        std::ofstream out("example_input/hello.txt", std::ios::binary);
        for (int i = 0; i < 200; i++) {
            out << "Hello, chunked world! line " << i << "\n";
        }
    }

    // 2. Create the cache; construction scans the input directory
    CacheConfig config = CacheConfig::default_config();
    config.input_dir = "example_input";
    config.cache_dir = "example_cache";
    EncodingCache cache(config);

    auto files = cache.list_files();
    if (files.empty()) {
        std::cerr << "No files found in example_input" << std::endl;
        return 1;
    }
    const FileRecord& file = files.front();
    std::cout << "✓ Registered " << file.filename << " (" << file.original_size << " bytes) as "
              << file.file_id << "\n" << std::endl;

    // 3. Before any chunk is produced the info is an estimate
    const uint64_t chunk_size = 1024;
    FileInfo info = cache.get_info(file.file_id, Encoding::BASE32, chunk_size);
    std::cout << "base32 @ " << chunk_size << " bytes: ~" << info.total_chunks << " chunks, ~"
              << info.encoded_size << " bytes (processed: " << (info.is_processed ? "yes" : "no")
              << ")" << std::endl;

    // 4. Fetch every chunk; the first pass encodes, the second reads the cache
    for (int pass = 1; pass <= 2; pass++) {
        uint32_t index = 0;
        size_t from_cache = 0;
        for (;;) {
            ChunkResult chunk = cache.get_chunk(file.file_id, Encoding::BASE32, index, chunk_size);
            if (!chunk.success) {
                std::cerr << "Chunk " << index << " failed: " << chunk.message << std::endl;
                return 1;
            }
            from_cache += chunk.from_cache ? 1 : 0;
            if (chunk.is_last) {
                break;
            }
            index++;
        }
        std::cout << "Pass " << pass << ": " << (index + 1) << " chunks, " << from_cache
                  << " from cache" << std::endl;
    }

    // 5. Now the info reports what is actually on disk
    info = cache.get_info(file.file_id, Encoding::BASE32, chunk_size);
    std::cout << "base32 @ " << chunk_size << " bytes: " << info.total_chunks << " chunks, "
              << info.encoded_size << " bytes (processed: " << (info.is_processed ? "yes" : "no")
              << ")\n" << std::endl;

    // 6. A yEnc chunk, decoded back to the source bytes
    ChunkResult first = cache.get_chunk(file.file_id, Encoding::YENC, 0, chunk_size);
    if (first.success) {
        DecodeResult decoded = decode(Encoding::YENC, first.data);
        std::cout << "yEnc chunk 0: " << first.data.size() << " encoded bytes -> "
                  << decoded.data.size() << " raw bytes" << std::endl;
    }

    cache.print_stats();

    // 7. Remove the file and its cache
    if (cache.remove_file(file.file_id) != ErrorCode::NONE) {
        std::cerr << "Failed to remove " << file.file_id << std::endl;
        return 1;
    }
    std::cout << "\n✓ Example completed successfully!" << std::endl;
    return 0;
}
