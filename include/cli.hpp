#ifndef CLI_HPP
#define CLI_HPP

#include "encoding_cache.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace encache {

/**
 * encache_server command line
 */
struct ServerOptions {
    std::string host;
    uint16_t port;
    size_t threads;
    CacheConfig cache;
    bool show_help;

    ServerOptions();
};

/**
 * Parse arguments (program name excluded)
 * @throws std::runtime_error on unknown options or invalid values
 */
ServerOptions parse_args(const std::vector<std::string>& args);

std::string usage();

} // namespace encache

#endif // CLI_HPP
