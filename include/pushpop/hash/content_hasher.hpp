#pragma once

#include "pushpop/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace pushpop::hash {

/// Length of a hex digest on the wire (SHA-256, lowercase hex).
constexpr std::size_t kDigestHexLength = 64;

/**
 * @brief Incremental SHA-256 over a byte stream
 *
 * Used on both sides of a transfer: the sender hashes the shared file
 * once (through HashCache), the receiver hashes the downloaded file chunk
 * by chunk from the engine's event loop.
 *
 * Not thread-safe; one hasher per stream.
 */
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    ContentHasher(ContentHasher&&) noexcept;
    ContentHasher& operator=(ContentHasher&&) noexcept;

    void update(const void* data, std::size_t len);

    /**
     * @brief Produce the hex digest and reset for reuse
     */
    std::string finalize();

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

using HashProgress = std::function<void(uint64_t processed, uint64_t total)>;

/**
 * @brief Hash a whole file, reading it in @p chunk_size blocks
 *
 * Open and read failures come back as ErrorKind::Filesystem.
 */
Result<std::string> hash_file(const std::filesystem::path& path,
                              std::size_t chunk_size = 128 * 1024,
                              const HashProgress& progress = {});

/**
 * @brief True only for exactly kDigestHexLength hex characters
 */
bool is_valid_digest(const std::string& text);

} // namespace pushpop::hash
