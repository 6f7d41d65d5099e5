#include "pushpop/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <vector>

namespace pushpop {

void configure_logging(const LoggingConfig& config, const std::string& debug_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file = config.file;
    const char* debug = std::getenv("DEBUG");
    if (file.empty() && debug != nullptr && *debug != '\0') {
        file = debug_file;
    }

    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("pushpop", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

} // namespace pushpop
