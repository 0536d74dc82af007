#include "cli.hpp"
#include "encoding_cache.hpp"
#include "http_api.hpp"
#include "http_server.hpp"
#include <exception>
#include <iostream>

using namespace encache;

int main(int argc, char** argv) {
    ServerOptions opts;
    try {
        opts = parse_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << usage();
        return 2;
    }

    if (opts.show_help) {
        std::cout << usage();
        return 0;
    }

    try {
        std::cout << "===== encache server =====" << std::endl;
        std::cout << "Input directory: " << opts.cache.input_dir << std::endl;
        std::cout << "Cache directory: " << opts.cache.cache_dir << std::endl;
        std::cout << "Default encoding: " << encoding_name(opts.cache.default_encoding)
                  << ", chunk size " << opts.cache.default_chunk_size << " bytes" << std::endl;

        EncodingCache cache(opts.cache);
        ApiRouter router(cache);
        HttpServer server(router, opts.host, opts.port, opts.threads);

        if (!server.start()) {
            return 1;
        }
        server.run();

        cache.print_stats();
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
