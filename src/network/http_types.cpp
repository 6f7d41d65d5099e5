#include "pushpop/network/http_types.hpp"

#include <cctype>

namespace pushpop {
namespace network {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// Strict decimal parse: digits only, no sign, no overflow.
std::optional<uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

} // namespace

std::optional<ByteRange> parse_range_header(const std::string& value) {
    const std::string header = trim(value);
    constexpr const char* kPrefix = "bytes=";
    if (header.compare(0, 6, kPrefix) != 0) {
        return std::nullopt;
    }

    const std::string range = trim(header.substr(6));
    if (range.find(',') != std::string::npos) {
        return std::nullopt;
    }

    const auto dash = range.find('-');
    if (dash == std::string::npos || dash == 0) {
        return std::nullopt;
    }

    auto first = parse_u64(trim(range.substr(0, dash)));
    if (!first) {
        return std::nullopt;
    }

    ByteRange result;
    result.first = *first;

    const std::string last_text = trim(range.substr(dash + 1));
    if (!last_text.empty()) {
        auto last = parse_u64(last_text);
        if (!last || *last < *first) {
            return std::nullopt;
        }
        result.last = *last;
    }
    return result;
}

std::optional<uint64_t> parse_content_range_total(const std::string& value) {
    const auto slash = value.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return parse_u64(trim(value.substr(slash + 1)));
}

std::string url_encode(const std::string& text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0f]);
        }
    }
    return out;
}

std::optional<std::string> url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size() ||
            !std::isxdigit(static_cast<unsigned char>(text[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
        i += 2;
    }
    return out;
}

} // namespace network
} // namespace pushpop
