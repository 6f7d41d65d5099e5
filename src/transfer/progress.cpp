#include "pushpop/transfer/progress.hpp"

#include <spdlog/fmt/fmt.h>

namespace pushpop::transfer {

std::string format_bytes(uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

std::string format_duration(std::chrono::seconds duration) {
    const auto total = duration.count() < 0 ? 0 : duration.count();
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{}h{:02}m{:02}s", hours, minutes, seconds);
    }
    if (minutes > 0) {
        return fmt::format("{}m{:02}s", minutes, seconds);
    }
    return fmt::format("{}s", seconds);
}

std::string render_progress(const DownloadSnapshot& s) {
    uint64_t done = s.bytes_transferred;
    int64_t total = s.total_bytes;
    if (s.phase == Phase::ComputingDigest || s.phase == Phase::Verifying) {
        done = s.verified_bytes;
        total = static_cast<int64_t>(s.verify_total_bytes);
    }

    std::string line = fmt::format("{:<18}", to_string(s.phase));

    if (s.phase == Phase::DigestPending || s.phase == Phase::FetchingDigest) {
        return line + fmt::format("attempt {}", s.digest_attempts);
    }

    if (total > 0) {
        const double percent = 100.0 * static_cast<double>(done) / static_cast<double>(total);
        line += fmt::format("{:5.1f}%  {} / {}", percent, format_bytes(done),
                            format_bytes(static_cast<uint64_t>(total)));
    } else {
        line += format_bytes(done);
    }

    if (s.bytes_per_second > 0.0) {
        line += fmt::format("  {}/s", format_bytes(static_cast<uint64_t>(s.bytes_per_second)));
    }
    if (s.remaining) {
        line += "  ETA " + format_duration(*s.remaining);
    }
    return line;
}

} // namespace pushpop::transfer
