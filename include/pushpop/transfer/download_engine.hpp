#pragma once

#include "pushpop/core/config.hpp"
#include "pushpop/core/result.hpp"
#include "pushpop/events/event_queue.hpp"
#include "pushpop/hash/content_hasher.hpp"
#include "pushpop/network/http_client.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace pushpop::transfer {

/**
 * @brief Receiver phases
 *
 * Requesting -> Streaming -> Renaming -> FetchingDigest
 *   -> (DigestPending <-> FetchingDigest) -> ComputingDigest -> Verifying -> Done
 *
 * Failed is reachable from every phase.
 */
enum class Phase {
    Requesting,
    Streaming,
    Renaming,
    FetchingDigest,
    DigestPending,
    ComputingDigest,
    Verifying,
    Done,
    Failed
};

const char* to_string(Phase phase);

inline bool is_terminal(Phase phase) {
    return phase == Phase::Done || phase == Phase::Failed;
}

struct DownloadRequest {
    std::string url;                     // http://host:port/ or http://host:port/<name>
    std::filesystem::path local_filename;
    std::string username;                // sent in X-PushPop-User
    uint64_t resume_offset = 0;          // length of the existing .part file
};

struct EngineConfig {
    std::size_t chunk_size = 128 * 1024;
    std::chrono::milliseconds tick_interval{100};
    std::chrono::milliseconds digest_retry_interval{1000};
    std::size_t max_digest_attempts = 0;  // 0 = until cancelled
    std::size_t io_threads = 2;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds idle_timeout{60000};

    static EngineConfig from(const DownloadConfig& config);
};

/**
 * @brief Mutable state of one download
 *
 * Owned by the engine and only touched on the thread that called run().
 * bytes_transferred counts bytes in the partial file, resumed bytes
 * included; total_bytes is -1 until the response head says otherwise.
 */
struct DownloadSession {
    std::string target_url;
    std::filesystem::path local_filename;
    std::filesystem::path partial_filename;

    Phase phase = Phase::Requesting;
    int64_t total_bytes = -1;
    uint64_t bytes_transferred = 0;
    uint64_t resume_offset = 0;
    bool range_downgraded = false;

    uint64_t verified_bytes = 0;
    uint64_t verify_total_bytes = 0;

    std::string remote_digest;
    std::string local_digest;
    std::size_t digest_attempts = 0;

    double bytes_per_second = 0.0;
    std::optional<Error> error;
};

/**
 * @brief Read-only view handed to the progress observer
 */
struct DownloadSnapshot {
    Phase phase = Phase::Requesting;
    int64_t total_bytes = -1;
    uint64_t bytes_transferred = 0;
    uint64_t resume_offset = 0;
    uint64_t verified_bytes = 0;
    uint64_t verify_total_bytes = 0;
    std::size_t digest_attempts = 0;
    double bytes_per_second = 0.0;
    std::optional<std::chrono::seconds> remaining;
    std::chrono::milliseconds elapsed{0};
};

struct DownloadReport {
    std::filesystem::path final_path;
    uint64_t bytes = 0;
    uint64_t resumed_from = 0;
    std::string digest;
    bool range_downgraded = false;
    std::chrono::milliseconds elapsed{0};
};

using DownloadOutcome = Result<DownloadReport>;

using ProgressObserver = std::function<void(const DownloadSnapshot&)>;

/**
 * Messages delivered to the engine thread. Every I/O task posts exactly
 * one of the *Done / *Read events back; timers post Tick and RetryElapsed.
 */
namespace engine_event {

struct ResponseReady { Result<void> result; };
struct BodyRead { Result<std::size_t> result; };
struct ChunkWritten { Result<void> result; std::size_t length = 0; };
struct RenameDone { Result<void> result; };

struct DigestReply {
    int status = 0;
    std::string body;
};
struct DigestFetched { Result<DigestReply> result; };

struct FileChunkRead { Result<std::size_t> result; };
struct Tick {};
struct RetryElapsed {};
struct CancelRequested {};

} // namespace engine_event

using EngineEvent = std::variant<
    engine_event::ResponseReady,
    engine_event::BodyRead,
    engine_event::ChunkWritten,
    engine_event::RenameDone,
    engine_event::DigestFetched,
    engine_event::FileChunkRead,
    engine_event::Tick,
    engine_event::RetryElapsed,
    engine_event::CancelRequested>;

/**
 * @brief Event-driven receiver: download, rename, fetch digest, verify
 *
 * The caller's thread runs the state machine. Network reads, disk
 * reads/writes, the rename and the digest request run as one-shot tasks
 * on a private io_context and each posts one event back. Only one task
 * is outstanding at a time, so every chunk is written before the next
 * read is issued.
 *
 * USAGE:
 * ```cpp
 * DownloadEngine engine(request, config);
 * engine.set_progress_observer([](const DownloadSnapshot& s) { ... });
 * auto outcome = engine.run();   // blocks until Done or Failed
 * ```
 *
 * THREAD SAFETY:
 * - run() is called once, from one thread
 * - cancel() may be called from any thread, before or during run()
 */
class DownloadEngine {
public:
    DownloadEngine(DownloadRequest request, EngineConfig config = {});
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    /// Called on the run() thread on each tick and each phase change.
    void set_progress_observer(ProgressObserver observer);

    DownloadOutcome run();

    /**
     * @brief Ask the engine to stop
     *
     * Interrupts the in-flight network read, waits for the outstanding
     * task, closes handles and fails with ErrorKind::Cancelled. The
     * partial file is left in place for a later resume.
     */
    void cancel();

    /// Engine-thread view; use the observer while run() is active.
    const DownloadSession& session() const { return session_; }

private:
    template<typename Task>
    void dispatch(Task task);

    void start_request();
    void start_read();
    void start_write(std::size_t length);
    void start_rename();
    void start_digest_fetch();
    void start_verify_read();
    void arm_tick();
    void arm_retry();

    void on_event(engine_event::ResponseReady& event);
    void on_event(engine_event::BodyRead& event);
    void on_event(engine_event::ChunkWritten& event);
    void on_event(engine_event::RenameDone& event);
    void on_event(engine_event::DigestFetched& event);
    void on_event(engine_event::FileChunkRead& event);
    void on_event(engine_event::Tick& event);
    void on_event(engine_event::RetryElapsed& event);
    void on_event(engine_event::CancelRequested& event);

    bool finish_if_cancelled();
    void begin_streaming(bool truncate);
    void begin_hashing();
    void verify();

    void set_phase(Phase phase);
    void fail(Error error);
    void fail(ErrorKind kind, std::string message);
    void complete();
    void release_handles();
    void notify();
    DownloadSnapshot snapshot() const;

    DownloadRequest request_;
    EngineConfig config_;
    network::HttpClient client_;
    network::Url file_url_;
    network::Url digest_url_;

    DownloadSession session_;
    ProgressObserver observer_;

    events::ThreadSafeQueue<EngineEvent> queue_;
    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::vector<std::thread> io_threads_;
    boost::asio::steady_timer tick_timer_;
    boost::asio::steady_timer retry_timer_;

    // Handles used by the outstanding task; the engine thread leaves them
    // alone while busy_ is set.
    std::unique_ptr<network::HttpBodyStream> stream_;
    std::ofstream partial_out_;
    std::ifstream verify_in_;
    std::vector<char> buffer_;
    hash::ContentHasher hasher_;

    bool busy_ = false;
    bool cancel_requested_ = false;
    bool started_ = false;

    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point last_sample_at_;
    uint64_t last_sample_bytes_ = 0;
    std::optional<DownloadReport> report_;
};

} // namespace pushpop::transfer
