#pragma once

#include "pushpop/transfer/download_engine.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace pushpop::transfer {

/// 1536 -> "1.5 KiB"
std::string format_bytes(uint64_t bytes);

/// 95 -> "1m35s"
std::string format_duration(std::chrono::seconds duration);

/**
 * @brief One-line text rendering of a snapshot
 *
 * e.g. "downloading  42.0%  21.0 MiB / 50.0 MiB  8.3 MiB/s  ETA 3s"
 */
std::string render_progress(const DownloadSnapshot& snapshot);

} // namespace pushpop::transfer
