#include "pushpop/server/resumable_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pushpop::server {
namespace fs = std::filesystem;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

HttpResponse plain(HttpStatus status, const std::string& text) {
    HttpResponse response(status);
    response.set_header("Content-Type", "text/plain");
    response.set_body(text);
    return response;
}

// "alice@192.168.1.20:51234"; the user part is whatever the client claims.
std::string requester(const HttpRequest& request) {
    std::string user = request.get_header(network::kUserHeader);
    if (user.empty()) {
        user = "unknown";
    }
    const std::string forwarded = request.get_header("X-Forwarded-For");
    const std::string& address = forwarded.empty() ? request.remote_address : forwarded;
    return user + "@" + (address.empty() ? std::string("?") : address);
}

} // namespace

ResumableServer::ResumableServer(fs::path file, hash::HashCache& cache, ServerOptions options)
    : file_(std::move(file))
    , file_name_(file_.filename().string())
    , cache_(cache)
    , options_(std::move(options)) {
}

ResumableServer::~ResumableServer() {
    stop();
}

void ResumableServer::start() {
    http_ = std::make_unique<network::HttpServerAsio>(
        io_context_, options_.port, options_.address, options_.chunk_size);
    http_->set_handler([this](const HttpRequest& request) {
        return handle(request);
    });
    port_ = http_->get_port();

    const std::size_t thread_count = options_.threads == 0 ? 1 : options_.threads;
    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    spdlog::info("Serving {} on port {} ({} threads)", file_name_, port_, thread_count);
}

void ResumableServer::stop() {
    if (http_) {
        http_->stop();
    }
    io_context_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

HttpResponse ResumableServer::handle(const HttpRequest& request) {
    const std::string who = requester(request);

    if (request.method != HttpMethod::GET) {
        spdlog::warn("[{}] {} {} rejected", who,
                     network::HttpMethodUtils::to_string(request.method), request.url);
        HttpResponse response = plain(HttpStatus::METHOD_NOT_ALLOWED, "Only GET is supported\n");
        response.set_header("Allow", "GET");
        return response;
    }

    auto decoded = network::url_decode(request.path());
    if (!decoded) {
        return plain(HttpStatus::BAD_REQUEST, "Malformed URL\n");
    }
    const std::string& path = *decoded;

    if (path == "/" || path == "/" + file_name_) {
        return serve_file(request, who);
    }
    if (path == "/" + file_name_ + network::kDigestSuffix) {
        return serve_digest(who);
    }

    spdlog::info("[{}] requested unknown path {}", who, path);
    return plain(HttpStatus::NOT_FOUND, "Not found\n");
}

HttpResponse ResumableServer::serve_file(const HttpRequest& request, const std::string& who) {
    std::error_code ec;
    const auto size = fs::file_size(file_, ec);
    if (ec) {
        spdlog::error("[{}] cannot stat {}: {}", who, file_.string(), ec.message());
        return plain(HttpStatus::INTERNAL_SERVER_ERROR, "File unavailable\n");
    }
    const uint64_t total = static_cast<uint64_t>(size);

    const std::string range_header = request.get_header("Range");
    auto range = range_header.empty() ? std::nullopt : network::parse_range_header(range_header);

    if (!range) {
        if (!range_header.empty()) {
            spdlog::debug("[{}] ignoring unsupported Range '{}'", who, range_header);
        }
        spdlog::info("[{}] download started ({} bytes)", who, total);
        HttpResponse response(HttpStatus::OK);
        response.set_header("Content-Type", "application/octet-stream");
        response.set_header("Accept-Ranges", "bytes");
        response.set_file_body(file_, 0, total);
        return response;
    }

    if (range->first >= total) {
        spdlog::info("[{}] range start {} is past the end ({} bytes)", who, range->first, total);
        HttpResponse response = plain(HttpStatus::RANGE_NOT_SATISFIABLE, "");
        response.set_header("Content-Range", "bytes */" + std::to_string(total));
        response.set_header("Accept-Ranges", "bytes");
        return response;
    }

    const uint64_t last = range->last ? std::min(*range->last, total - 1) : total - 1;
    const uint64_t length = last - range->first + 1;

    spdlog::info("[{}] download resumed at byte {} ({} bytes left)", who, range->first, length);
    HttpResponse response(HttpStatus::PARTIAL_CONTENT);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Accept-Ranges", "bytes");
    response.set_header("Content-Range", "bytes " + std::to_string(range->first) + "-" +
                                         std::to_string(last) + "/" + std::to_string(total));
    response.set_file_body(file_, range->first, length);
    return response;
}

HttpResponse ResumableServer::serve_digest(const std::string& who) {
    spdlog::info("[{}] requested digest", who);

    const auto lookup = cache_.request(file_);
    switch (lookup.status) {
        case hash::HashStatus::Pending: {
            spdlog::debug("[{}] digest still computing", who);
            HttpResponse response(HttpStatus::SERVICE_UNAVAILABLE);
            response.set_header("Retry-After", "1");
            response.set_body("");
            return response;
        }
        case hash::HashStatus::Failed:
            spdlog::error("[{}] digest unavailable: {}", who, lookup.error ? lookup.error->message : "unknown");
            return plain(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to compute digest\n");
        case hash::HashStatus::Ready:
            break;
    }

    spdlog::info("[{}] served digest {}", who, lookup.digest);
    return plain(HttpStatus::OK, lookup.digest);
}

} // namespace pushpop::server
