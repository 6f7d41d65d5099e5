#include "pushpop/network/http_server_asio.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>

namespace pushpop {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler, std::size_t chunk_size)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_()
    , file_chunk_(chunk_size) {

    boost::system::error_code ec;
    const auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_address_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error from {}: {}", remote_address_, ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error(parse_result.error().message);
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.get_request();
            request.remote_address = remote_address_;

            spdlog::debug("{} {} HTTP/{} from {}",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
                remote_address_);

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
            }

            do_write(std::move(response));
        }
    );
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();

    response.set_header("Connection", "close");

    if (response.file_body) {
        const FileBody& body = *response.file_body;
        file_.open(body.path, std::ios::binary);
        if (file_) {
            file_.seekg(static_cast<std::streamoff>(body.offset));
        }
        if (!file_) {
            spdlog::error("Cannot open {} for streaming", body.path.string());
            response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Cannot read file");
        } else {
            file_remaining_ = body.length;
        }
    }

    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error to {}: {}", remote_address_, ec.message());
                }
                return;
            }
            if (file_remaining_ > 0) {
                do_write_file_chunk();
            } else {
                finish();
            }
        }
    );
}

void HttpConnection::do_write_file_chunk() {
    auto self = shared_from_this();

    const auto want = static_cast<std::streamsize>(
        std::min<uint64_t>(file_remaining_, file_chunk_.size()));
    file_.read(file_chunk_.data(), want);
    const auto got = file_.gcount();
    if (got <= 0) {
        // File shrank underneath us; the client sees a short body.
        spdlog::error("Short read while streaming to {} ({} bytes left)", remote_address_, file_remaining_);
        finish();
        return;
    }

    asio::async_write(
        socket_,
        asio::buffer(file_chunk_.data(), static_cast<size_t>(got)),
        [this, self](boost::system::error_code ec, size_t written) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Client {} went away: {}", remote_address_, ec.message());
                }
                return;
            }
            file_remaining_ -= written;
            if (file_remaining_ > 0) {
                do_write_file_chunk();
            } else {
                finish();
            }
        }
    );
}

void HttpConnection::finish() {
    file_.close();
    boost::system::error_code shutdown_ec;
    socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Bad request from {}: {}", remote_address_, message);
    do_write(create_error_response(HttpStatus::BAD_REQUEST, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message + "\n");
    response.set_header("Content-Type", "text/plain");
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               uint16_t port,
                               const std::string& address,
                               std::size_t chunk_size)
    : acceptor_(io_context)
    , chunk_size_(chunk_size == 0 ? 128 * 1024 : chunk_size)
    , port_(port) {

    const tcp::endpoint endpoint(asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("HTTP server listening on {}:{}", address, port_);

    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Error closing acceptor: {}", ec.message());
    }
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                spdlog::debug("Acceptor closed");
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_, chunk_size_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace pushpop
