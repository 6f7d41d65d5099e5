#include "pushpop/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <sstream>

namespace pushpop {
namespace network {

// ──────────────────────────────────────────────────────────
// Url
// ──────────────────────────────────────────────────────────

Result<Url> Url::parse(const std::string& text) {
    constexpr const char* kScheme = "http://";
    if (text.compare(0, 7, kScheme) != 0) {
        return Err<Url>(ErrorKind::Config, "only http:// URLs are supported: " + text);
    }

    std::string rest = text.substr(7);
    Url url;

    const auto slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    url.target = slash == std::string::npos ? "/" : rest.substr(slash);

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(ErrorKind::Config, "unterminated IPv6 literal in " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(ErrorKind::Config, "malformed authority in " + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        return Err<Url>(ErrorKind::Config, "missing host in " + text);
    }

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return Err<Url>(ErrorKind::Config, "invalid port in " + text);
        }
        const auto port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(ErrorKind::Config, "invalid port in " + text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    return Ok(url);
}

Url Url::with_target(std::string new_target) const {
    Url copy = *this;
    copy.target = std::move(new_target);
    return copy;
}

std::string Url::to_string() const {
    std::ostringstream oss;
    oss << "http://";
    if (host.find(':') != std::string::npos) {
        oss << "[" << host << "]";
    } else {
        oss << host;
    }
    oss << ":" << port << target;
    return oss.str();
}

// ──────────────────────────────────────────────────────────
// HttpBodyStream
// ──────────────────────────────────────────────────────────

HttpBodyStream::HttpBodyStream(std::chrono::milliseconds idle_timeout)
    : io_()
    , socket_(io_)
    , idle_timeout_(idle_timeout) {
}

HttpBodyStream::~HttpBodyStream() {
    close();
}

void HttpBodyStream::close() {
    boost::system::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void HttpBodyStream::abort() {
    aborted_.store(true, std::memory_order_release);
    asio::post(io_, [this]() {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    });
}

void HttpBodyStream::run(std::chrono::milliseconds timeout) {
    io_.restart();
    io_.run_for(timeout);

    // Deadline passed with the operation still pending: closing the socket
    // makes it complete with operation_aborted.
    if (!io_.stopped()) {
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_.run();
    }
}

Error HttpBodyStream::io_error(const boost::system::error_code& ec, const std::string& what) const {
    if (aborted_.load(std::memory_order_acquire)) {
        return Error{ErrorKind::Cancelled, what + " aborted"};
    }
    if (ec == asio::error::operation_aborted) {
        return Error{ErrorKind::Transport, what + " timed out"};
    }
    return Error{ErrorKind::Transport, what + " failed: " + ec.message()};
}

Result<void> HttpBodyStream::connect(const Url& url, std::chrono::milliseconds timeout) {
    if (aborted_.load(std::memory_order_acquire)) {
        return Err<void, Error>(Error{ErrorKind::Cancelled, "connect aborted"});
    }
    tcp::resolver resolver(io_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(url.host, std::to_string(url.port), ec);
    if (ec) {
        return Err<void, Error>(Error{ErrorKind::Transport, "cannot resolve " + url.host + ": " + ec.message()});
    }

    ec = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&ec](const boost::system::error_code& result, const tcp::endpoint&) { ec = result; });
    run(timeout);

    if (ec) {
        return Err<void, Error>(io_error(ec, "connect to " + url.host + ":" + std::to_string(url.port)));
    }
    return Ok();
}

Result<void> HttpBodyStream::send(const std::string& data) {
    boost::system::error_code ec = asio::error::would_block;
    asio::async_write(socket_, asio::buffer(data),
        [&ec](const boost::system::error_code& result, std::size_t) { ec = result; });
    run(idle_timeout_);

    if (ec) {
        return Err<void, Error>(io_error(ec, "send request"));
    }
    return Ok();
}

Result<void> HttpBodyStream::read_head() {
    HttpResponseHeadParser parser;
    std::array<char, 8192> buffer{};

    while (true) {
        boost::system::error_code ec = asio::error::would_block;
        std::size_t n = 0;
        socket_.async_read_some(asio::buffer(buffer),
            [&ec, &n](const boost::system::error_code& result, std::size_t bytes) {
                ec = result;
                n = bytes;
            });
        run(idle_timeout_);

        if (ec == asio::error::eof) {
            return Err<void, Error>(Error{ErrorKind::Transport, "connection closed before response head"});
        }
        if (ec) {
            return Err<void, Error>(io_error(ec, "read response head"));
        }

        std::size_t consumed = 0;
        auto parsed = parser.parse(buffer.data(), n, consumed);
        if (parsed.is_error()) {
            return Err<void, Error>(parsed.error());
        }
        if (parsed.value()) {
            head_ = parser.head();
            pending_.assign(buffer.begin() + static_cast<std::ptrdiff_t>(consumed),
                            buffer.begin() + static_cast<std::ptrdiff_t>(n));
            break;
        }
    }

    if (!head_.get_header("Transfer-Encoding").empty() &&
        strcasecmp_cross_platform(head_.get_header("Transfer-Encoding").c_str(), "identity") != 0) {
        return Err<void, Error>(Error{ErrorKind::Protocol,
            "unsupported Transfer-Encoding: " + head_.get_header("Transfer-Encoding")});
    }

    remaining_ = head_.content_length();
    if (!head_.get_header("Content-Length").empty() && remaining_ < 0) {
        return Err<void, Error>(Error{ErrorKind::Protocol,
            "invalid Content-Length: " + head_.get_header("Content-Length")});
    }
    return Ok();
}

Result<std::size_t> HttpBodyStream::read_some(char* out, std::size_t max) {
    if (aborted_.load(std::memory_order_acquire)) {
        return Err<std::size_t>(ErrorKind::Cancelled, "read aborted");
    }
    if (max == 0 || remaining_ == 0 || eof_) {
        return Ok<std::size_t>(0);
    }

    std::size_t want = max;
    if (remaining_ > 0) {
        want = static_cast<std::size_t>(std::min<int64_t>(remaining_, static_cast<int64_t>(max)));
    }

    std::size_t n = 0;
    if (pending_pos_ < pending_.size()) {
        n = std::min(want, pending_.size() - pending_pos_);
        std::memcpy(out, pending_.data() + pending_pos_, n);
        pending_pos_ += n;
    } else {
        boost::system::error_code ec = asio::error::would_block;
        socket_.async_read_some(asio::buffer(out, want),
            [&ec, &n](const boost::system::error_code& result, std::size_t bytes) {
                ec = result;
                n = bytes;
            });
        run(idle_timeout_);

        if (ec == asio::error::eof) {
            eof_ = true;
            if (remaining_ > 0) {
                return Err<std::size_t>(ErrorKind::Transport,
                    "connection closed after " + std::to_string(body_read_) + " body bytes, " +
                    std::to_string(remaining_) + " missing");
            }
            return Ok<std::size_t>(0);
        }
        if (ec) {
            return Err<std::size_t, Error>(io_error(ec, "read body"));
        }
    }

    body_read_ += n;
    if (remaining_ > 0) {
        remaining_ -= static_cast<int64_t>(n);
    }
    return Ok(n);
}

Result<std::string> HttpBodyStream::read_all(std::size_t limit) {
    std::string body;
    std::array<char, 4096> buffer{};
    while (body.size() < limit) {
        auto chunk = read_some(buffer.data(), std::min(buffer.size(), limit - body.size()));
        if (chunk.is_error()) {
            return Err<std::string, Error>(chunk.error());
        }
        if (chunk.value() == 0) {
            break;
        }
        body.append(buffer.data(), chunk.value());
    }
    return Ok(body);
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds idle_timeout)
    : connect_timeout_(connect_timeout)
    , idle_timeout_(idle_timeout) {
}

std::unique_ptr<HttpBodyStream> HttpClient::open_stream() const {
    return std::unique_ptr<HttpBodyStream>(new HttpBodyStream(idle_timeout_));
}

Result<std::unique_ptr<HttpBodyStream>> HttpClient::get(const Url& url, const HeaderMap& headers) const {
    auto stream = open_stream();
    if (auto res = start_get(*stream, url, headers); res.is_error()) {
        return Err<std::unique_ptr<HttpBodyStream>, Error>(res.error());
    }
    return Ok(std::move(stream));
}

Result<void> HttpClient::start_get(HttpBodyStream& stream, const Url& url, const HeaderMap& headers) const {
    if (auto res = stream.connect(url, connect_timeout_); res.is_error()) {
        return res;
    }

    std::ostringstream request;
    request << "GET " << url.target << " HTTP/1.1\r\n";
    if (url.host.find(':') != std::string::npos) {
        request << "Host: [" << url.host << "]:" << url.port << "\r\n";
    } else {
        request << "Host: " << url.host << ":" << url.port << "\r\n";
    }
    for (const auto& [name, value] : headers) {
        request << name << ": " << value << "\r\n";
    }
    request << "Connection: close\r\n\r\n";

    spdlog::debug("GET {}", url.to_string());

    if (auto res = stream.send(request.str()); res.is_error()) {
        return res;
    }
    if (auto res = stream.read_head(); res.is_error()) {
        return res;
    }

    spdlog::debug("{} -> {} {}", url.to_string(), stream.status_code(), stream.head().reason_phrase);
    return Ok();
}

} // namespace network
} // namespace pushpop
