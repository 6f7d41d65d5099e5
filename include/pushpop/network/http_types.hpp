#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace pushpop {
namespace network {

/// Claimed identity of the requester; logged, never trusted.
constexpr const char* kUserHeader = "X-PushPop-User";

/// Appended to the file name to address its digest.
constexpr const char* kDigestSuffix = ".digest";

enum class HttpMethod {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid Windows macro conflict
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

/**
 * @brief Status codes used by the transfer protocol
 *
 * 206 vs. 200 is how a receiver learns whether its Range was honoured;
 * 503 on the digest route means "still computing, retry".
 */
enum class HttpStatus {
    OK = 200,
    PARTIAL_CONTENT = 206,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    RANGE_NOT_SATISFIABLE = 416,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

using HeaderMap = std::unordered_map<std::string, std::string>;

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

/**
 * @brief Case-insensitive header lookup (RFC 7230 names are case-insensitive)
 *
 * @return Header value if found, empty string otherwise
 */
inline std::string find_header(const HeaderMap& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;
    HttpVersion version = HttpVersion::HTTP_1_1;
    HeaderMap headers;
    std::vector<uint8_t> body;
    std::string remote_address;  // filled in by the server, "ip:port"

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    /// URL without query string or fragment.
    std::string path() const {
        const auto pos = url.find_first_of("?#");
        return pos == std::string::npos ? url : url.substr(0, pos);
    }
};

/**
 * @brief Region of a file streamed after the response head
 *
 * Lets the server send large files without loading them into memory.
 */
struct FileBody {
    std::filesystem::path path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;
    std::optional<FileBody> file_body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        file_body.reset();
        headers["Content-Length"] = std::to_string(body.size());
    }

    /**
     * @brief Stream @p length bytes of @p path starting at @p offset
     */
    void set_file_body(const std::filesystem::path& path, uint64_t offset, uint64_t length) {
        body.clear();
        file_body = FileBody{path, offset, length};
        headers["Content-Length"] = std::to_string(length);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    /**
     * @brief Status line and headers, terminated by the empty line
     */
    std::string serialize_head() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";
        return oss.str();
    }

    /**
     * @brief Head plus in-memory body (file bodies are streamed separately)
     */
    std::vector<uint8_t> serialize() const {
        std::string head = serialize_head();
        std::vector<uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::PARTIAL_CONTENT: return "Partial Content";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::RANGE_NOT_SATISFIABLE: return "Range Not Satisfiable";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

/**
 * @brief Status line and headers of a response read by the client
 *
 * The body is not part of this; HttpClient streams it separately.
 */
struct HttpResponseHead {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }

    /// Content-Length, or -1 when absent or unparseable.
    int64_t content_length() const {
        const auto value = get_header("Content-Length");
        if (value.empty()) {
            return -1;
        }
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(value, &consumed);
            if (consumed != value.size() || parsed < 0) {
                return -1;
            }
            return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            return -1;
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief First/last byte of a single "bytes=" range
 *
 * last is inclusive; nullopt means "to the end of the resource".
 */
struct ByteRange {
    uint64_t first = 0;
    std::optional<uint64_t> last;
};

/**
 * @brief Parse a single-range "bytes=N-" or "bytes=N-M" header value
 *
 * Suffix ranges ("bytes=-N"), multi-range lists and malformed values
 * return nullopt; callers then ignore the header and serve the whole
 * resource, which HTTP permits.
 */
std::optional<ByteRange> parse_range_header(const std::string& value);

/// Total length from a Content-Range value ("bytes a-b/total" or "bytes */total").
std::optional<uint64_t> parse_content_range_total(const std::string& value);

/// Percent-encode everything outside RFC 3986 unreserved characters.
std::string url_encode(const std::string& text);

/// Decode %XX escapes; nullopt on a malformed escape.
std::optional<std::string> url_decode(const std::string& text);

} // namespace network
} // namespace pushpop
