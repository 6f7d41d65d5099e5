#include "pushpop/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pushpop {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Result<void> validate(const Config& config) {
    if (config.server.threads == 0) {
        return Err<void, Error>(Error{ErrorKind::Config, "server.threads must be > 0"});
    }
    if (config.server.chunk_size == 0 || config.download.chunk_size == 0) {
        return Err<void, Error>(Error{ErrorKind::Config, "chunk_size must be > 0"});
    }
    if (config.download.tick_interval.count() <= 0) {
        return Err<void, Error>(Error{ErrorKind::Config, "download.tick_interval_ms must be > 0"});
    }
    if (config.download.digest_retry_interval.count() <= 0) {
        return Err<void, Error>(Error{ErrorKind::Config, "download.digest_retry_ms must be > 0"});
    }
    if (config.download.io_threads == 0) {
        return Err<void, Error>(Error{ErrorKind::Config, "download.io_threads must be > 0"});
    }
    if (spdlog::level::from_str(config.logging.level) == spdlog::level::off &&
        config.logging.level != "off") {
        return Err<void, Error>(Error{ErrorKind::Config, "unknown logging.level '" + config.logging.level + "'"});
    }
    return Ok();
}

} // namespace

Result<Config> parse_config(const std::string& json_text) {
    Config config;
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Err<Config>(ErrorKind::Config, std::string("invalid JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        return Err<Config>(ErrorKind::Config, "configuration root must be an object");
    }

    try {
        if (auto it = doc.find("server"); it != doc.end() && it->is_object()) {
            const auto& s = *it;
            config.server.threads = s.value("threads", config.server.threads);
            config.server.chunk_size = s.value("chunk_size", config.server.chunk_size);
            config.server.port = s.value("port", config.server.port);
        }
        if (auto it = doc.find("download"); it != doc.end() && it->is_object()) {
            const auto& d = *it;
            config.download.chunk_size = d.value("chunk_size", config.download.chunk_size);
            config.download.tick_interval = std::chrono::milliseconds(
                d.value("tick_interval_ms", static_cast<int64_t>(config.download.tick_interval.count())));
            config.download.digest_retry_interval = std::chrono::milliseconds(
                d.value("digest_retry_ms", static_cast<int64_t>(config.download.digest_retry_interval.count())));
            config.download.max_digest_attempts =
                d.value("max_digest_attempts", config.download.max_digest_attempts);
            config.download.io_threads = d.value("io_threads", config.download.io_threads);
        }
        if (auto it = doc.find("logging"); it != doc.end() && it->is_object()) {
            const auto& l = *it;
            config.logging.level = l.value("level", config.logging.level);
            config.logging.file = l.value("file", config.logging.file);
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorKind::Config, std::string("invalid configuration value: ") + e.what());
    }

    if (auto res = validate(config); res.is_error()) {
        return Err<Config, Error>(res.error());
    }
    return Ok(config);
}

Result<Config> load_config_file(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorKind::Config, "cannot open configuration file " + path.string());
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    auto parsed = parse_config(oss.str());
    if (parsed.is_error()) {
        return Err<Config>(ErrorKind::Config, path.string() + ": " + parsed.error().message);
    }
    return parsed;
}

std::optional<fs::path> default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
        return fs::path(xdg) / "pushpop" / "config.json";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return fs::path(home) / ".config" / "pushpop" / "config.json";
    }
    return std::nullopt;
}

Result<Config> resolve_config(const std::optional<fs::path>& explicit_path) {
    Config config;

    if (explicit_path) {
        auto loaded = load_config_file(*explicit_path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = loaded.value();
    } else {
        std::optional<fs::path> candidate;
        if (const char* env = std::getenv("PUSHPOP_CONFIG"); env != nullptr && *env != '\0') {
            candidate = fs::path(env);
        } else {
            candidate = default_config_path();
        }

        std::error_code ec;
        if (candidate && fs::exists(*candidate, ec)) {
            auto loaded = load_config_file(*candidate);
            if (loaded.is_error()) {
                return loaded;
            }
            config = loaded.value();
        }
    }

    if (const char* debug = std::getenv("DEBUG"); debug != nullptr && *debug != '\0') {
        config.logging.level = "debug";
    }
    return Ok(config);
}

} // namespace pushpop
