#include "pushpop/core/config.hpp"
#include "pushpop/core/logging.hpp"
#include "pushpop/core/platform.hpp"
#include "pushpop/discovery/identity.hpp"
#include "pushpop/discovery/service.hpp"
#include "pushpop/transfer/download_engine.hpp"
#include "pushpop/transfer/progress.hpp"
#include "pushpop/transfer/reconciler.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace pushpop;

namespace {

void print_usage() {
    std::cerr << "USAGE: pop [--force] [--config <path>] --peer <user@host:port/name>... [username]\n";
}

// Offers name a file; only its last component is used locally.
std::optional<fs::path> local_name(const std::string& offered) {
    const fs::path name = fs::path(offered).filename();
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return name;
}

} // namespace

int main(int argc, char* argv[]) {
    bool force = false;
    std::optional<fs::path> config_path;
    std::vector<std::string> peers;
    std::string username;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--force" || arg == "-f") {
            force = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if (arg == "--peer" && i + 1 < argc) {
            peers.emplace_back(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "pop: unknown option " << arg << "\n";
            print_usage();
            return 1;
        } else if (username.empty()) {
            username = arg;
        } else {
            print_usage();
            return 1;
        }
    }

    if (username.empty()) {
        username = current_username();
        if (username.empty()) {
            std::cerr << "pop: unable to determine username\n";
            return 1;
        }
    }

    auto config = resolve_config(config_path);
    if (config.is_error()) {
        std::cerr << "pop: " << config.error().describe() << "\n";
        return 1;
    }
    configure_logging(config.value().logging, "pop_debug.log");

    if (peers.empty()) {
        std::cerr << "pop: no peers given; pass --peer user@host:port/name\n";
        print_usage();
        return 1;
    }

    std::vector<discovery::ServiceEntry> entries;
    for (const auto& peer : peers) {
        auto entry = discovery::parse_peer_spec(peer);
        if (entry.is_error()) {
            std::cerr << "pop: " << entry.error().describe() << "\n";
            return 1;
        }
        entries.push_back(entry.value());
    }

    auto networks = discovery::local_networks();
    if (networks.is_error()) {
        std::cerr << "pop: " << networks.error().describe() << "\n";
        return 1;
    }

    discovery::StaticServiceBrowser browser(std::move(entries));
    auto offer = discovery::find_offer(browser, username, networks.value());
    if (offer.is_error()) {
        std::cerr << "pop: " << offer.error().describe() << "\n";
        return 1;
    }

    const auto final_path = local_name(offer.value().display_name);
    if (!final_path) {
        std::cerr << "pop: refusing unusable file name '" << offer.value().display_name << "'\n";
        return 1;
    }
    const fs::path partial_path = transfer::partial_path_for(*final_path);

    transfer::TerminalPrompt prompt(std::cin, std::cout);
    const transfer::ResumePlan plan = transfer::reconcile(*final_path, partial_path, force, prompt);
    if (plan.action == transfer::ResumeAction::Abort) {
        std::cout << "Aborted by user." << std::endl;
        return 0;
    }
    if (auto res = transfer::apply_plan(plan, *final_path, partial_path); res.is_error()) {
        std::cerr << "pop: " << res.error().describe() << "\n";
        return 1;
    }
    if (plan.action == transfer::ResumeAction::KeepExisting) {
        std::cout << "Keeping existing " << final_path->string() << std::endl;
        return 0;
    }

    transfer::DownloadRequest request;
    request.url = offer.value().base_url();
    request.local_filename = *final_path;
    request.username = username;
    request.resume_offset = plan.offset;

    transfer::DownloadEngine engine(request, transfer::EngineConfig::from(config.value().download));
    engine.set_progress_observer([](const transfer::DownloadSnapshot& snapshot) {
        std::cout << "\r" << transfer::render_progress(snapshot) << "\x1b[K" << std::flush;
    });

    // Ctrl-C turns into an orderly cancel on the engine thread.
    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&engine](const boost::system::error_code& error, int) {
        if (!error) {
            engine.cancel();
        }
    });
    std::thread signal_thread([&signal_io]() { signal_io.run(); });

    const transfer::DownloadOutcome outcome = engine.run();

    signal_io.stop();
    signal_thread.join();
    std::cout << std::endl;

    if (outcome.is_error()) {
        std::cout << "Failed: " << outcome.error().describe() << std::endl;
        return 1;
    }

    const auto& report = outcome.value();
    if (report.range_downgraded) {
        std::cout << "Note: the sender ignored the resume request; the file was downloaded again." << std::endl;
    }
    std::cout << "Downloaded " << report.final_path.string() << " (" << transfer::format_bytes(report.bytes)
              << ") in " << transfer::format_duration(std::chrono::duration_cast<std::chrono::seconds>(report.elapsed))
              << ", digest " << report.digest << std::endl;
    return 0;
}
