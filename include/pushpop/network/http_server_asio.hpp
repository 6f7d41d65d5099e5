#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "http_parser.hpp"
#include "http_types.hpp"
#include "pushpop/core/result.hpp"

#include <array>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pushpop {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection that reads one
 * request, hands it to the handler, writes the response head and body,
 * and closes. File bodies are streamed from disk one chunk at a time;
 * the next chunk is read only after the previous write completed.
 *
 * Uses enable_shared_from_this to stay alive while operations are pending.
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t chunk_size);

    void start();

private:
    void do_read();

    void do_write(HttpResponse response);

    void do_write_file_chunk();

    void finish();

    void handle_error(const std::string& message);

    HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpRequestParser parser_;
    std::array<char, 8192> buffer_;
    std::string remote_address_;

    // Streaming state for FileBody responses
    std::ifstream file_;
    uint64_t file_remaining_ = 0;
    std::vector<char> file_chunk_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * The server only accepts; the io_context it is given does the work. Run
 * io_context.run() from several threads to handle connections
 * concurrently; each connection has at most one pending operation, so no
 * strand is needed.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, 0);   // 0 = ephemeral port
 * server.set_handler([](const HttpRequest& req) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("hello");
 *     return res;
 * });
 * io_context.run();
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @brief Bind and start accepting
     *
     * @param io_context Event loop (must outlive this server)
     * @param port Port to listen on; 0 lets the OS choose
     * @param address Local address to bind
     * @throws boost::system::system_error when the address cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context,
                   uint16_t port,
                   const std::string& address = "0.0.0.0",
                   std::size_t chunk_size = 128 * 1024);

    void set_handler(HttpRequestHandler handler);

    /**
     * @brief Stop accepting new connections
     *
     * Connections already accepted run to completion.
     */
    void stop();

    uint16_t get_port() const { return port_; }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    std::size_t chunk_size_;
    uint16_t port_;
};

} // namespace network
} // namespace pushpop
