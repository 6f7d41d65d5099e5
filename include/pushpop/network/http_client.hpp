#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "http_parser.hpp"
#include "http_types.hpp"
#include "pushpop/core/result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pushpop {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Parsed "http://host[:port]/target" URL
 *
 * IPv6 literals are written in brackets: http://[fe80::1]:8080/
 */
struct Url {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";

    static Result<Url> parse(const std::string& text);

    /// Same URL with @p target replaced.
    Url with_target(std::string new_target) const;

    std::string to_string() const;
};

/**
 * @brief Open response whose body is read on demand
 *
 * Every operation blocks the calling thread. Internally each step is an
 * async Asio operation run on the stream's own io_context with a
 * deadline, which is what makes abort() possible from another thread.
 *
 * The body ends at Content-Length when the server sent one, otherwise at
 * connection close. A connection closed before Content-Length bytes
 * arrived is a transport error, not a short success.
 */
class HttpBodyStream {
public:
    ~HttpBodyStream();

    HttpBodyStream(const HttpBodyStream&) = delete;
    HttpBodyStream& operator=(const HttpBodyStream&) = delete;

    const HttpResponseHead& head() const { return head_; }

    int status_code() const { return head_.status_code; }

    /**
     * @brief Read up to @p max bytes of body
     *
     * @return bytes read, 0 at the end of the body
     */
    Result<std::size_t> read_some(char* out, std::size_t max);

    /**
     * @brief Read the rest of the body, stopping after @p limit bytes
     */
    Result<std::string> read_all(std::size_t limit);

    /**
     * @brief Interrupt a blocked read and close the connection
     *
     * THREAD SAFE: Yes. The interrupted read returns ErrorKind::Cancelled.
     */
    void abort();

    /// Close the connection now. Not thread-safe; use abort() across threads.
    void close();

private:
    friend class HttpClient;

    explicit HttpBodyStream(std::chrono::milliseconds idle_timeout);

    Result<void> connect(const Url& url, std::chrono::milliseconds timeout);
    Result<void> send(const std::string& data);
    Result<void> read_head();

    // Runs io_ until the pending operation completes or the deadline passes.
    void run(std::chrono::milliseconds timeout);

    Error io_error(const boost::system::error_code& ec, const std::string& what) const;

    asio::io_context io_;
    tcp::socket socket_;
    std::chrono::milliseconds idle_timeout_;
    std::atomic<bool> aborted_{false};

    HttpResponseHead head_;
    std::vector<char> pending_;   // body bytes read together with the head
    std::size_t pending_pos_ = 0;
    int64_t remaining_ = -1;      // -1 = read until close
    uint64_t body_read_ = 0;
    bool eof_ = false;
};

/**
 * @brief Minimal blocking HTTP/1.1 GET client
 *
 * One request per connection (Connection: close). Used by the receiver
 * for both the file and the digest.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds connect_timeout = std::chrono::seconds(10),
                        std::chrono::milliseconds idle_timeout = std::chrono::seconds(60));

    /**
     * @brief Send a GET and return once the response head has arrived
     */
    Result<std::unique_ptr<HttpBodyStream>> get(const Url& url, const HeaderMap& headers = {}) const;

    /**
     * @brief Unconnected stream for start_get()
     *
     * Lets a caller hold the stream, and so abort() it, before the
     * connection is even attempted.
     */
    std::unique_ptr<HttpBodyStream> open_stream() const;

    /**
     * @brief Connect @p stream, send the GET and read the response head
     */
    Result<void> start_get(HttpBodyStream& stream, const Url& url, const HeaderMap& headers = {}) const;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds idle_timeout_;
};

} // namespace network
} // namespace pushpop
