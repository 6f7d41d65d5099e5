#include "pushpop/core/config.hpp"
#include "pushpop/core/logging.hpp"
#include "pushpop/core/platform.hpp"
#include "pushpop/discovery/identity.hpp"
#include "pushpop/discovery/service.hpp"
#include "pushpop/hash/hash_cache.hpp"
#include "pushpop/server/resumable_server.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage() {
    std::cerr << "USAGE: push [--config <path>] [--port <n>] [--threads <n>] <file>\n";
}

std::optional<unsigned long> parse_number(const std::string& text) {
    try {
        std::size_t used = 0;
        const unsigned long value = std::stoul(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<fs::path> config_path;
    std::optional<unsigned long> port;
    std::optional<unsigned long> threads;
    std::optional<fs::path> file;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = parse_number(argv[++i]);
            if (!port || *port > 65535) {
                std::cerr << "push: invalid port\n";
                return 1;
            }
        } else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            threads = parse_number(argv[++i]);
            if (!threads || *threads == 0) {
                std::cerr << "push: invalid thread count\n";
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "push: unknown option " << arg << "\n";
            print_usage();
            return 1;
        } else if (!file) {
            file = fs::path(arg);
        } else {
            print_usage();
            return 1;
        }
    }

    if (!file) {
        print_usage();
        return 1;
    }

    auto config = pushpop::resolve_config(config_path);
    if (config.is_error()) {
        std::cerr << "push: " << config.error().describe() << "\n";
        return 1;
    }
    if (port) {
        config.value().server.port = static_cast<uint16_t>(*port);
    }
    if (threads) {
        config.value().server.threads = *threads;
    }
    pushpop::configure_logging(config.value().logging, "push_debug.log");

    std::error_code ec;
    if (!fs::is_regular_file(*file, ec)) {
        std::cerr << "push: " << file->string() << " is not a readable file\n";
        return 1;
    }

    const std::string user = pushpop::current_username();
    if (user.empty()) {
        std::cerr << "push: unable to determine the current user\n";
        return 1;
    }

    // Start hashing right away so the digest is usually ready by the time
    // a receiver finishes downloading.
    pushpop::hash::HashCache cache(config.value().server.chunk_size);
    cache.prefetch(*file);

    pushpop::server::ServerOptions options;
    options.port = config.value().server.port;
    options.threads = config.value().server.threads;
    options.chunk_size = config.value().server.chunk_size;

    pushpop::server::ResumableServer server(*file, cache, options);
    try {
        server.start();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Cannot listen on port {}: {}", options.port, e.what());
        return 1;
    }

    std::cout << "Serving " << server.file_name() << " on port " << server.port() << std::endl;

    pushpop::discovery::LoggingAnnouncer announcer;
    if (auto res = announcer.announce(server.file_name(), server.port(), {"user=" + user}); res.is_error()) {
        spdlog::error("Announcement failed: {}", res.error().describe());
        server.stop();
        return 1;
    }
    // Receivers match peers by IP, so the hint must carry a literal address.
    std::string host = "<this-host-ip>";
    if (auto networks = pushpop::discovery::local_networks(); networks.is_ok()) {
        if (auto address = pushpop::discovery::advertised_address(networks.value())) {
            host = address->find(':') != std::string::npos ? "[" + *address + "]" : *address;
        }
    } else {
        spdlog::warn("Cannot list local addresses: {}", networks.error().describe());
    }
    std::cout << "Receive with: pop --peer " << user << "@" << host << ":" << server.port()
              << "/" << server.file_name() << " " << user << std::endl;

    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            spdlog::info("Received signal {}, shutting down...", signal_number);
        }
    });
    signal_io.run();

    announcer.withdraw();
    server.stop();
    spdlog::debug("Hash cache ran {} computations, {} worker threads left to join",
                  cache.computations(), cache.worker_threads());
    spdlog::info("Stopped");
    return 0;
}
