#include "pushpop/hash/hash_cache.hpp"
#include "pushpop/server/resumable_server.hpp"
#include "pushpop/transfer/download_engine.hpp"
#include "pushpop/transfer/reconciler.hpp"

#include "../test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace pushpop;
using namespace pushpop::network;
using namespace pushpop::transfer;
using pushpop::testing::ScriptedHttpServer;
using pushpop::testing::create_temp_dir;
using pushpop::testing::make_payload;
using pushpop::testing::read_file;
using pushpop::testing::sha256_hex;
using pushpop::testing::write_file;

namespace fs = std::filesystem;

namespace {

/**
 * Serves one in-memory file the way the sender does, with knobs for the
 * misbehaviours the receiver has to cope with.
 */
struct FakeSender {
    std::string name;
    std::string data;
    std::string digest;             // served on the .digest route
    bool honour_range = true;
    int digest_pending_replies = 0; // 503s before the digest is served
    int file_status = 200;          // anything but 200 is returned as-is

    std::atomic<int> digest_requests{0};
    std::mutex mutex;
    std::vector<std::string> ranges_seen;
    std::vector<std::string> users_seen;

    HttpResponse operator()(const HttpRequest& request) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ranges_seen.push_back(request.get_header("Range"));
            users_seen.push_back(request.get_header(kUserHeader));
        }

        auto path = url_decode(request.path());
        if (path && *path == "/" + name + kDigestSuffix) {
            const int n = ++digest_requests;
            if (n <= digest_pending_replies) {
                HttpResponse pending(HttpStatus::SERVICE_UNAVAILABLE);
                pending.set_body("");
                return pending;
            }
            HttpResponse response(HttpStatus::OK);
            response.set_body(digest + "\n");
            return response;
        }
        if (!path || *path != "/") {
            HttpResponse missing(HttpStatus::NOT_FOUND);
            missing.set_body("");
            return missing;
        }

        if (file_status != 200) {
            HttpResponse response;
            response.status_code = file_status;
            response.reason_phrase = "Scripted";
            response.set_body("");
            return response;
        }

        auto range = honour_range ? parse_range_header(request.get_header("Range")) : std::nullopt;
        if (!range) {
            HttpResponse response(HttpStatus::OK);
            response.set_body(data);
            return response;
        }
        if (range->first >= data.size()) {
            HttpResponse response(HttpStatus::RANGE_NOT_SATISFIABLE);
            response.set_header("Content-Range", "bytes */" + std::to_string(data.size()));
            response.set_body("");
            return response;
        }
        HttpResponse response(HttpStatus::PARTIAL_CONTENT);
        response.set_header("Content-Range", "bytes " + std::to_string(range->first) + "-" +
                                             std::to_string(data.size() - 1) + "/" +
                                             std::to_string(data.size()));
        response.set_body(data.substr(range->first));
        return response;
    }
};

/**
 * Sends a response head and a little of the body, then stalls with the
 * connection open until destroyed.
 */
class StallingServer {
public:
    StallingServer(std::string head, std::string body_prefix)
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0))
        , socket_(io_)
        , hold_(io_)
        , response_(std::move(head) + std::move(body_prefix)) {
        acceptor_.async_accept(socket_, [this](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            boost::asio::async_read_until(socket_, request_, "\r\n\r\n",
                [this](const boost::system::error_code& read_ec, std::size_t) {
                    if (read_ec) {
                        return;
                    }
                    boost::asio::async_write(socket_, boost::asio::buffer(response_),
                        [this](const boost::system::error_code& write_ec, std::size_t) {
                            if (write_ec) {
                                return;
                            }
                            hold_.expires_after(std::chrono::seconds(30));
                            hold_.async_wait([](const boost::system::error_code&) {});
                        });
                });
        });
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~StallingServer() {
        io_.stop();
        thread_.join();
    }

    std::string base_url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/";
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    boost::asio::steady_timer hold_;
    boost::asio::streambuf request_;
    std::string response_;
    std::thread thread_;
};

EngineConfig fast_config() {
    EngineConfig config;
    config.chunk_size = 4096;
    config.tick_interval = std::chrono::milliseconds(20);
    config.digest_retry_interval = std::chrono::milliseconds(10);
    config.connect_timeout = std::chrono::seconds(5);
    config.idle_timeout = std::chrono::seconds(10);
    return config;
}

} // namespace

class DownloadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("engine");
        final_ = dir_ / "archive.tar";
        partial_ = partial_path_for(final_);

        sender_.name = "archive.tar";
        sender_.data = make_payload(200 * 1024 + 17);
        sender_.digest = sha256_hex(sender_.data);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    DownloadRequest request_for(const std::string& url, uint64_t offset = 0) const {
        DownloadRequest request;
        request.url = url;
        request.local_filename = final_;
        request.username = "alice";
        request.resume_offset = offset;
        return request;
    }

    HttpRequestHandler handler() {
        return [this](const HttpRequest& request) { return sender_(request); };
    }

    fs::path dir_;
    fs::path final_;
    fs::path partial_;
    FakeSender sender_;
};

TEST_F(DownloadEngineTest, DownloadsRenamesAndVerifies) {
    ScriptedHttpServer server(handler());

    std::vector<Phase> phases;
    DownloadEngine engine(request_for(server.base_url()), fast_config());
    engine.set_progress_observer([&phases](const DownloadSnapshot& snapshot) {
        if (phases.empty() || phases.back() != snapshot.phase) {
            phases.push_back(snapshot.phase);
        }
    });

    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    EXPECT_EQ(read_file(final_), sender_.data);
    EXPECT_FALSE(fs::exists(partial_));
    EXPECT_EQ(outcome.value().digest, sender_.digest);
    EXPECT_EQ(outcome.value().bytes, sender_.data.size());
    EXPECT_EQ(outcome.value().resumed_from, 0u);
    EXPECT_FALSE(outcome.value().range_downgraded);

    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.back(), Phase::Done);
    EXPECT_EQ(engine.session().phase, Phase::Done);

    std::lock_guard<std::mutex> lock(sender_.mutex);
    ASSERT_FALSE(sender_.users_seen.empty());
    EXPECT_EQ(sender_.users_seen.front(), "alice");
    EXPECT_TRUE(sender_.ranges_seen.front().empty());
}

TEST_F(DownloadEngineTest, ResumesFromPartialFile) {
    const std::size_t offset = 70000;
    write_file(partial_, sender_.data.substr(0, offset));
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url(), offset), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    EXPECT_EQ(read_file(final_), sender_.data);
    EXPECT_EQ(outcome.value().resumed_from, offset);
    EXPECT_FALSE(outcome.value().range_downgraded);

    std::lock_guard<std::mutex> lock(sender_.mutex);
    EXPECT_EQ(sender_.ranges_seen.front(), "bytes=70000-");
}

TEST_F(DownloadEngineTest, CompletePartialFileSkipsStraightToVerification) {
    write_file(partial_, sender_.data);
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url(), sender_.data.size()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(read_file(final_), sender_.data);
    EXPECT_FALSE(fs::exists(partial_));
}

TEST_F(DownloadEngineTest, RangeIgnoredRestartsFromZero) {
    write_file(partial_, std::string(5000, 'z'));  // garbage that must not survive
    sender_.honour_range = false;
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url(), 5000), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();

    EXPECT_TRUE(outcome.value().range_downgraded);
    EXPECT_EQ(read_file(final_), sender_.data);
}

TEST_F(DownloadEngineTest, WaitsWhileDigestIsPending) {
    sender_.digest_pending_replies = 2;
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(sender_.digest_requests.load(), 3);
    EXPECT_EQ(engine.session().digest_attempts, 3u);
}

TEST_F(DownloadEngineTest, GivesUpAfterMaxDigestAttempts) {
    sender_.digest_pending_replies = 1000;
    ScriptedHttpServer server(handler());

    EngineConfig config = fast_config();
    config.max_digest_attempts = 2;
    DownloadEngine engine(request_for(server.base_url()), config);
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Protocol);
    EXPECT_EQ(sender_.digest_requests.load(), 2);
    // The download itself finished; only verification is missing.
    EXPECT_TRUE(fs::exists(final_));
}

TEST_F(DownloadEngineTest, MismatchDeletesTheFile) {
    sender_.digest = sha256_hex("something else entirely");
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Integrity);
    EXPECT_NE(outcome.error().message.find(sender_.digest), std::string::npos);
    EXPECT_FALSE(fs::exists(final_));
    EXPECT_FALSE(fs::exists(partial_));
    EXPECT_EQ(engine.session().phase, Phase::Failed);
}

TEST_F(DownloadEngineTest, MalformedDigestIsProtocolError) {
    sender_.digest = "not-a-digest";
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Protocol);
    EXPECT_NE(outcome.error().message.find("malformed digest"), std::string::npos);
    // Nothing says the file is bad, so it stays.
    EXPECT_TRUE(fs::exists(final_));
}

TEST_F(DownloadEngineTest, DigestComparisonIsExact) {
    std::string upper = sender_.digest;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    sender_.digest = upper;
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Integrity);
}

TEST_F(DownloadEngineTest, UnexpectedStatusFails) {
    sender_.file_status = 404;
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Protocol);
    EXPECT_FALSE(fs::exists(final_));
}

TEST_F(DownloadEngineTest, ShortBodyKeepsPartialForResume) {
    ScriptedHttpServer server([](const HttpRequest&) {
        HttpResponse response(HttpStatus::OK);
        response.set_body(std::string(1000, 'a'));
        response.set_header("Content-Length", "50000");
        return response;
    });

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Transport);
    EXPECT_FALSE(fs::exists(final_));
    ASSERT_TRUE(fs::exists(partial_));
    EXPECT_EQ(fs::file_size(partial_), 1000u);
}

TEST_F(DownloadEngineTest, CancelDuringStreamKeepsPartial) {
    const std::string head = "HTTP/1.1 200 OK\r\nContent-Length: 1000000\r\nConnection: close\r\n\r\n";
    StallingServer server(head, std::string(3000, 'b'));

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    std::atomic<bool> cancelled{false};
    engine.set_progress_observer([&engine, &cancelled](const DownloadSnapshot& snapshot) {
        if (snapshot.phase == Phase::Streaming && snapshot.bytes_transferred >= 3000 && !cancelled.exchange(true)) {
            engine.cancel();
        }
    });

    const auto started = std::chrono::steady_clock::now();
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(8));

    EXPECT_FALSE(fs::exists(final_));
    ASSERT_TRUE(fs::exists(partial_));
    EXPECT_EQ(fs::file_size(partial_), 3000u);
}

TEST_F(DownloadEngineTest, CancelBeforeRunStopsImmediately) {
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    engine.cancel();
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(final_));
}

TEST_F(DownloadEngineTest, DigestUrlUsesTheNamedTarget) {
    ScriptedHttpServer server([this](const HttpRequest& request) {
        // Same file under its name instead of "/".
        HttpRequest copy = request;
        if (copy.path() == "/archive.tar") {
            copy.url = "/";
        }
        return sender_(copy);
    });

    DownloadEngine engine(request_for(server.base_url() + "archive.tar"), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(sender_.digest_requests.load(), 1);
}

TEST_F(DownloadEngineTest, RunsOnlyOnce) {
    ScriptedHttpServer server(handler());
    DownloadEngine engine(request_for(server.base_url()), fast_config());
    ASSERT_TRUE(engine.run().is_ok());

    auto second = engine.run();
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().kind, ErrorKind::Config);
}

TEST_F(DownloadEngineTest, BadUrlFailsBeforeAnyIo) {
    DownloadEngine engine(request_for("ftp://somewhere/"), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_FALSE(fs::exists(partial_));
}

TEST_F(DownloadEngineTest, RoundTripAgainstResumableServer) {
    const fs::path shared_dir = dir_ / "sender";
    fs::create_directories(shared_dir);
    const fs::path shared = shared_dir / "archive.tar";
    write_file(shared, sender_.data);

    hash::HashCache cache(16 * 1024);
    server::ServerOptions options;
    options.address = "127.0.0.1";
    options.port = 0;
    options.threads = 2;
    options.chunk_size = 16 * 1024;
    server::ResumableServer server(shared, cache, options);
    server.start();
    const std::string url = "http://127.0.0.1:" + std::to_string(server.port()) + "/";

    DownloadEngine fresh(request_for(url), fast_config());
    auto first = fresh.run();
    ASSERT_TRUE(first.is_ok()) << first.error().describe();
    EXPECT_EQ(read_file(final_), sender_.data);
    EXPECT_EQ(first.value().digest, sender_.digest);
    EXPECT_GE(fresh.session().digest_attempts, 1u);

    // Second receiver starts from a partial file; the server must answer 206.
    fs::remove(final_);
    write_file(partial_, sender_.data.substr(0, 1000));
    DownloadEngine resumed(request_for(url, 1000), fast_config());
    auto second = resumed.run();
    ASSERT_TRUE(second.is_ok()) << second.error().describe();
    EXPECT_EQ(read_file(final_), sender_.data);
    EXPECT_EQ(second.value().digest, sender_.digest);
    EXPECT_EQ(second.value().resumed_from, 1000u);
    EXPECT_FALSE(second.value().range_downgraded);
    EXPECT_FALSE(fs::exists(partial_));

    // Both receivers were served from one hash pass.
    EXPECT_EQ(cache.computations(), 1u);
    server.stop();
}

TEST_F(DownloadEngineTest, InterruptedSessionResumesWithoutGapsOrDuplicates) {
    const std::size_t sent_before_stall = 70001;
    const std::string head = "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(sender_.data.size()) +
                             "\r\nConnection: close\r\n\r\n";

    {
        StallingServer stalling(head, sender_.data.substr(0, sent_before_stall));
        DownloadEngine first(request_for(stalling.base_url()), fast_config());
        std::atomic<bool> cancelled{false};
        first.set_progress_observer([&first, &cancelled, sent_before_stall](const DownloadSnapshot& snapshot) {
            if (snapshot.phase == Phase::Streaming && snapshot.bytes_transferred >= sent_before_stall &&
                !cancelled.exchange(true)) {
                first.cancel();
            }
        });
        auto outcome = first.run();
        ASSERT_TRUE(outcome.is_error());
        EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
    }
    ASSERT_TRUE(fs::exists(partial_));
    ASSERT_FALSE(fs::exists(final_));
    const uint64_t offset = fs::file_size(partial_);
    EXPECT_EQ(offset, sent_before_stall);

    ScriptedHttpServer server(handler());
    DownloadEngine second(request_for(server.base_url(), offset), fast_config());
    auto outcome = second.run();
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().describe();
    EXPECT_EQ(outcome.value().resumed_from, offset);

    const std::string received = read_file(final_);
    ASSERT_EQ(received.size(), sender_.data.size());
    EXPECT_TRUE(received == sender_.data);
    EXPECT_EQ(outcome.value().digest, sender_.digest);

    std::lock_guard<std::mutex> lock(sender_.mutex);
    EXPECT_EQ(sender_.ranges_seen.front(), "bytes=" + std::to_string(offset) + "-");
}

TEST_F(DownloadEngineTest, RenameFailureIsFilesystemError) {
    // A non-empty directory where the final file should go.
    fs::create_directories(final_);
    write_file(final_ / "keep.txt", "x");
    ScriptedHttpServer server(handler());

    DownloadEngine engine(request_for(server.base_url()), fast_config());
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Filesystem);
    EXPECT_NE(outcome.error().message.find("cannot rename"), std::string::npos);
    EXPECT_EQ(engine.session().phase, Phase::Failed);

    // The downloaded bytes stay in the partial file.
    ASSERT_TRUE(fs::exists(partial_));
    EXPECT_EQ(read_file(partial_), sender_.data);
    EXPECT_EQ(sender_.digest_requests.load(), 0);
}

TEST_F(DownloadEngineTest, CancelWhileDigestPending) {
    sender_.digest_pending_replies = 1000;
    ScriptedHttpServer server(handler());

    EngineConfig config = fast_config();
    config.digest_retry_interval = std::chrono::seconds(30);
    DownloadEngine engine(request_for(server.base_url()), config);
    std::atomic<bool> cancelled{false};
    engine.set_progress_observer([&engine, &cancelled](const DownloadSnapshot& snapshot) {
        if (snapshot.phase == Phase::DigestPending && !cancelled.exchange(true)) {
            engine.cancel();
        }
    });

    const auto started = std::chrono::steady_clock::now();
    auto outcome = engine.run();
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().kind, ErrorKind::Cancelled);
    // The pending retry timer does not hold the run open.
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(sender_.digest_requests.load(), 1);
}

TEST(PhaseTest, TerminalPhases) {
    EXPECT_TRUE(is_terminal(Phase::Done));
    EXPECT_TRUE(is_terminal(Phase::Failed));
    EXPECT_FALSE(is_terminal(Phase::DigestPending));
    EXPECT_STREQ(to_string(Phase::Streaming), "downloading");
}

TEST(EngineConfigTest, CopiesDownloadSettings) {
    DownloadConfig download;
    download.chunk_size = 1234;
    download.tick_interval = std::chrono::milliseconds(55);
    download.digest_retry_interval = std::chrono::milliseconds(250);
    download.max_digest_attempts = 9;
    download.io_threads = 3;

    const EngineConfig config = EngineConfig::from(download);
    EXPECT_EQ(config.chunk_size, 1234u);
    EXPECT_EQ(config.tick_interval.count(), 55);
    EXPECT_EQ(config.digest_retry_interval.count(), 250);
    EXPECT_EQ(config.max_digest_attempts, 9u);
    EXPECT_EQ(config.io_threads, 3u);
}
