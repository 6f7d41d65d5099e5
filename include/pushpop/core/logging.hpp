#pragma once

#include "pushpop/core/config.hpp"

#include <string>

namespace pushpop {

/**
 * @brief Install the process-wide spdlog logger
 *
 * Console output uses the pattern "[%H:%M:%S] [%^%l%$] %v". When
 * @p config.file is set, records also go to that file. When DEBUG is set
 * and no file is configured, @p debug_file is used instead.
 */
void configure_logging(const LoggingConfig& config, const std::string& debug_file = {});

} // namespace pushpop
