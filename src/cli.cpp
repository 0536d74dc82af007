#include "cli.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace encache {

namespace {

uint64_t parse_number(const std::string& flag, const std::string& value) {
    if (value.empty() || value.size() > 19 ||
        !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::runtime_error("Invalid value for " + flag + ": " + value);
    }
    return std::stoull(value);
}

} // namespace

ServerOptions::ServerOptions()
    : host("0.0.0.0")
    , port(8000)
    , threads(std::max(2u, std::thread::hardware_concurrency()))
    , show_help(false) {
}

ServerOptions parse_args(const std::vector<std::string>& args) {
    ServerOptions opts;
    std::string preset;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& tok = args[i];
        auto require_value = [&](const std::string& flag) -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return args[++i];
        };

        if (tok == "--help" || tok == "-h") {
            opts.show_help = true;
        } else if (tok == "--input" || tok == "-i") {
            opts.cache.input_dir = require_value(tok);
        } else if (tok == "--cache" || tok == "-c") {
            opts.cache.cache_dir = require_value(tok);
        } else if (tok == "--host") {
            opts.host = require_value(tok);
        } else if (tok == "--port" || tok == "-p") {
            uint64_t port = parse_number(tok, require_value(tok));
            if (port > 65535) {
                throw std::runtime_error("--port must be at most 65535");
            }
            opts.port = static_cast<uint16_t>(port);
        } else if (tok == "--threads" || tok == "-t") {
            opts.threads = parse_number(tok, require_value(tok));
            if (opts.threads == 0) {
                throw std::runtime_error("--threads must be positive");
            }
        } else if (tok == "--chunk-size") {
            opts.cache.default_chunk_size = parse_number(tok, require_value(tok));
        } else if (tok == "--encoding" || tok == "-e") {
            const std::string& name = require_value(tok);
            auto encoding = parse_encoding(name);
            if (!encoding) {
                throw std::runtime_error("Unsupported encoding: " + name);
            }
            opts.cache.default_encoding = *encoding;
        } else if (tok == "--compression") {
            const std::string& name = require_value(tok);
            auto algo = parse_compression(name);
            if (!algo) {
                throw std::runtime_error("Unknown compression: " + name);
            }
            opts.cache.cache_compression = *algo;
        } else if (tok == "--preset") {
            preset = require_value(tok);
            CacheConfig base;
            if (preset == "default") {
                base = CacheConfig::default_config();
            } else if (preset == "low-disk") {
                base = CacheConfig::config_for_low_disk();
            } else if (preset == "throughput") {
                base = CacheConfig::config_for_throughput();
            } else {
                throw std::runtime_error("Unknown preset: " + preset);
            }
            // Presets reset everything except the directories
            base.input_dir = opts.cache.input_dir;
            base.cache_dir = opts.cache.cache_dir;
            opts.cache = base;
        } else if (tok == "--hex-uppercase") {
            opts.cache.hex_uppercase = true;
        } else if (tok == "--no-prune") {
            opts.cache.prune_orphans_on_start = false;
        } else if (tok == "--no-rescan") {
            opts.cache.rescan_on_list = false;
        } else {
            throw std::runtime_error("Unknown option: " + tok);
        }
    }

    if (opts.show_help) {
        return opts;
    }

    if (opts.cache.input_dir.empty() || opts.cache.cache_dir.empty()) {
        throw std::runtime_error("--input and --cache must not be empty");
    }
    if (opts.cache.default_chunk_size < opts.cache.min_chunk_size ||
        opts.cache.default_chunk_size > opts.cache.max_chunk_size) {
        throw std::runtime_error("--chunk-size must be between " + std::to_string(opts.cache.min_chunk_size) +
                                 " and " + std::to_string(opts.cache.max_chunk_size));
    }

    return opts;
}

std::string usage() {
    return "Usage: encache_server [options]\n"
           "  -i, --input DIR         Directory scanned for source files (default: input_files)\n"
           "  -c, --cache DIR         Chunk cache directory (default: encache_cache)\n"
           "      --host ADDR         Listen address (default: 0.0.0.0)\n"
           "  -p, --port N            Listen port (default: 8000)\n"
           "  -t, --threads N         Worker threads\n"
           "      --chunk-size BYTES  Default target encoded chunk size (default: 1048576)\n"
           "  -e, --encoding NAME     Default encoding (default: base64)\n"
           "      --compression NAME  none, lz4, lz4hc, zstd-fast, zstd, zstd-max (default: lz4)\n"
           "      --preset NAME       default, low-disk, throughput\n"
           "      --hex-uppercase     Emit upper-case hex (clear the hex cache after changing)\n"
           "      --no-prune          Keep caches of files that are no longer present\n"
           "      --no-rescan         Do not rescan the input directory on /files and /health\n"
           "  -h, --help              Show this help\n";
}

} // namespace encache
