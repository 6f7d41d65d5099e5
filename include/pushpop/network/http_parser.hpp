#pragma once

#include "http_types.hpp"
#include "pushpop/core/result.hpp"

#include <cctype>
#include <string>

namespace pushpop {
namespace network {

/// Upper bound on a request line plus headers; larger heads are rejected.
constexpr std::size_t kMaxHeadBytes = 16 * 1024;

/**
 * @brief State machine states for HTTP message parsing
 *
 * Shared by the request parser (server side) and the response head
 * parser (client side). Data may arrive in arbitrary pieces; the parser
 * keeps its place between calls.
 */
enum class ParseState {
    START_LINE_1,    // method (request) / version (response)
    START_LINE_2,    // URL (request) / status code (response)
    START_LINE_3,    // version (request) / reason phrase (response)
    HEADER_NAME,
    HEADER_VALUE,
    BODY,            // request body (Content-Length bytes)
    COMPLETE,
    PARSE_ERROR      // renamed to avoid Windows macro conflict
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Usage:
 * ```cpp
 * HttpRequestParser parser;
 * auto result = parser.parse(buffer, n);
 * if (result.is_error()) { ... }
 * if (result.value()) { HttpRequest req = parser.get_request(); }
 * ```
 */
class HttpRequestParser {
public:
    HttpRequestParser() { reset(); }

    /**
     * @brief Feed bytes to the parser
     *
     * @return true when the request is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];

            if (state_ != ParseState::BODY && ++head_bytes_ > kMaxHeadBytes) {
                state_ = ParseState::PARSE_ERROR;
                return fail("Request head exceeds " + std::to_string(kMaxHeadBytes) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::START_LINE_1: ok = parse_method(c); break;
                case ParseState::START_LINE_2: ok = parse_url(c); break;
                case ParseState::START_LINE_3: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::BODY: parse_body(c); break;
                case ParseState::COMPLETE: return Ok(true);
                case ParseState::PARSE_ERROR: return fail("Parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return fail("Malformed request at line " + std::to_string(line_));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    HttpRequest get_request() const { return request_; }

    void reset() {
        state_ = ParseState::START_LINE_1;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        body_expected_ = 0;
        head_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t body_expected_;
    size_t head_bytes_;
    size_t line_;
    bool last_char_was_cr_;

    static Result<bool> fail(std::string message) {
        return Err<bool>(ErrorKind::Protocol, std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::START_LINE_2;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::START_LINE_3;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            const std::string content_length = request_.get_header("Content-Length");
            if (!content_length.empty()) {
                try {
                    body_expected_ = std::stoull(content_length);
                } catch (const std::exception&) {
                    return false;
                }
                if (body_expected_ > 0) {
                    request_.body.reserve(body_expected_);
                    state_ = ParseState::BODY;
                    return true;
                }
            }
            state_ = ParseState::COMPLETE;
            return true;
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    void parse_body(char c) {
        request_.body.push_back(static_cast<uint8_t>(c));
        if (request_.body.size() >= body_expected_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

/**
 * @brief Incremental parser for a response status line and headers
 *
 * Stops at the empty line; the caller keeps whatever follows as the
 * first bytes of the body (see @p consumed).
 *
 * "HTTP/1.1 206 Partial Content\r\n"
 * "Content-Range: bytes 100-199/200\r\n"
 * "\r\n"
 */
class HttpResponseHeadParser {
public:
    HttpResponseHeadParser() { reset(); }

    /**
     * @brief Feed bytes to the parser
     *
     * @param consumed Set to the number of bytes of @p data that belong to
     *                 the head; only meaningful when the result is true
     * @return true once the head is complete
     */
    Result<bool> parse(const char* data, size_t len, size_t& consumed) {
        consumed = 0;
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            ++consumed;

            if (++head_bytes_ > kMaxHeadBytes) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(ErrorKind::Protocol, "Response head too large");
            }

            bool ok = true;
            switch (state_) {
                case ParseState::START_LINE_1: ok = parse_version(c); break;
                case ParseState::START_LINE_2: ok = parse_status(c); break;
                case ParseState::START_LINE_3: ok = parse_reason(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::COMPLETE: --consumed; return Ok(true);
                case ParseState::BODY:
                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorKind::Protocol, "Parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(ErrorKind::Protocol, "Malformed response head");
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    const HttpResponseHead& head() const { return head_; }

    void reset() {
        state_ = ParseState::START_LINE_1;
        head_ = HttpResponseHead();
        buffer_.clear();
        current_header_name_.clear();
        head_bytes_ = 0;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpResponseHead head_;
    std::string buffer_;
    std::string current_header_name_;
    size_t head_bytes_;
    bool last_char_was_cr_;

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                head_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                head_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::START_LINE_2;
            return true;
        }
        buffer_ += c;
        return buffer_.size() <= 8;
    }

    bool parse_status(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            head_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ParseState::START_LINE_3;
            last_char_was_cr_ = (c == '\r');
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return buffer_.size() <= 3;
    }

    // Reason phrase is optional; ends at CRLF.
    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            head_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            state_ = ParseState::COMPLETE;
            return true;
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            head_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace pushpop
