#pragma once

#include "pushpop/hash/hash_cache.hpp"
#include "pushpop/network/http_server_asio.hpp"
#include "pushpop/network/http_types.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace pushpop::server {

struct ServerOptions {
    std::string address = "0.0.0.0";
    uint16_t port = 0;             // 0 = ephemeral
    std::size_t threads = 4;
    std::size_t chunk_size = 128 * 1024;
};

/**
 * @brief Sender-side HTTP endpoint for one shared file
 *
 * Routes:
 * - GET /            the file (honours "Range: bytes=N-")
 * - GET /<name>      same as /
 * - GET /<name>.digest  503 while hashing, 200 + hex digest, 500 on error
 *
 * The digest comes from a HashCache owned by the caller; the server
 * only ever uses the non-blocking request() so an I/O thread never waits
 * on a hash computation.
 *
 * THREAD SAFETY:
 * - handle() may run on any io thread concurrently
 * - The hash cache is the only shared mutable state
 */
class ResumableServer {
public:
    ResumableServer(std::filesystem::path file, hash::HashCache& cache, ServerOptions options = {});
    ~ResumableServer();

    ResumableServer(const ResumableServer&) = delete;
    ResumableServer& operator=(const ResumableServer&) = delete;

    /**
     * @brief Bind the listener and start the io threads
     *
     * @throws boost::system::system_error if the address cannot be bound
     */
    void start();

    /**
     * @brief Stop accepting, stop the io threads and join them
     */
    void stop();

    uint16_t port() const { return port_; }

    const std::string& file_name() const { return file_name_; }

    const std::filesystem::path& file_path() const { return file_; }

    /**
     * @brief Route one request; exposed for tests that skip the socket layer
     */
    network::HttpResponse handle(const network::HttpRequest& request);

private:
    network::HttpResponse serve_file(const network::HttpRequest& request, const std::string& who);
    network::HttpResponse serve_digest(const std::string& who);

    std::filesystem::path file_;
    std::string file_name_;
    hash::HashCache& cache_;
    ServerOptions options_;

    boost::asio::io_context io_context_;
    std::unique_ptr<network::HttpServerAsio> http_;
    std::vector<std::thread> threads_;
    uint16_t port_ = 0;
};

} // namespace pushpop::server
