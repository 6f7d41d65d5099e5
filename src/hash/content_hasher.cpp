#include "pushpop/hash/content_hasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace pushpop::hash {
namespace fs = std::filesystem;

struct ContentHasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx != nullptr) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

ContentHasher::ContentHasher() : impl_(std::make_unique<Impl>()) {
    reset();
}

ContentHasher::~ContentHasher() = default;

ContentHasher::ContentHasher(ContentHasher&&) noexcept = default;
ContentHasher& ContentHasher::operator=(ContentHasher&&) noexcept = default;

void ContentHasher::reset() {
    if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

void ContentHasher::update(const void* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("Failed to update SHA-256");
    }
}

std::string ContentHasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, md.data(), &md_len) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex.push_back(kHex[md[i] >> 4]);
        hex.push_back(kHex[md[i] & 0x0f]);
    }

    reset();
    return hex;
}

Result<std::string> hash_file(const fs::path& path, std::size_t chunk_size, const HashProgress& progress) {
    if (chunk_size == 0) {
        return Err<std::string>(ErrorKind::Config, "chunk_size must be > 0");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Filesystem, "Failed to open " + path.string());
    }

    std::error_code ec;
    const auto total = fs::file_size(path, ec);
    const uint64_t total_bytes = ec ? 0 : static_cast<uint64_t>(total);

    ContentHasher hasher;
    std::vector<char> buffer(chunk_size);
    uint64_t processed = 0;

    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        hasher.update(buffer.data(), count);
        processed += count;
        if (progress) {
            progress(processed, total_bytes);
        }
    }

    if (input.bad()) {
        return Err<std::string>(ErrorKind::Filesystem,
                                "Read failed after " + std::to_string(processed) + " bytes of " + path.string());
    }

    return Ok(hasher.finalize());
}

bool is_valid_digest(const std::string& text) {
    if (text.size() != kDigestHexLength) {
        return false;
    }
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace pushpop::hash
