#pragma once

#include "pushpop/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace pushpop {

struct ServerConfig {
    std::size_t threads = 4;
    std::size_t chunk_size = 128 * 1024;
    uint16_t port = 0;  // 0 = let the OS pick
};

struct DownloadConfig {
    std::size_t chunk_size = 128 * 1024;
    std::chrono::milliseconds tick_interval{100};
    std::chrono::milliseconds digest_retry_interval{1000};
    std::size_t max_digest_attempts = 0;  // 0 = retry until cancelled
    std::size_t io_threads = 2;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // empty = console only
};

struct Config {
    ServerConfig server;
    DownloadConfig download;
    LoggingConfig logging;
};

/**
 * @brief Parse a JSON configuration document on top of the defaults
 *
 * Missing keys keep their default value. Unknown keys are ignored.
 * Example:
 * ```json
 * {
 *   "server":   { "threads": 8, "chunk_size": 65536 },
 *   "download": { "tick_interval_ms": 100, "digest_retry_ms": 1000 },
 *   "logging":  { "level": "debug" }
 * }
 * ```
 */
Result<Config> parse_config(const std::string& json_text);

Result<Config> load_config_file(const std::filesystem::path& path);

/**
 * @brief Resolve the configuration the CLIs run with
 *
 * Order: defaults, then the first existing file among @p explicit_path,
 * $PUSHPOP_CONFIG and the XDG location, then the DEBUG environment
 * variable. An explicit path that does not exist is an error; the
 * implicit locations are optional.
 */
Result<Config> resolve_config(const std::optional<std::filesystem::path>& explicit_path);

std::optional<std::filesystem::path> default_config_path();

} // namespace pushpop
