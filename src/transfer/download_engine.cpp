#include "pushpop/transfer/download_engine.hpp"
#include "pushpop/transfer/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace pushpop::transfer {
namespace fs = std::filesystem;
namespace asio = boost::asio;
using namespace engine_event;

namespace {

// The server answers a digest request with a short text body; anything
// longer than this is not a digest.
constexpr std::size_t kMaxDigestBody = 1024;

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// "http://h:p/" -> "/<name>.digest", "http://h:p/<name>" -> "/<name>.digest"
std::string digest_target(const std::string& target, const std::string& name) {
    if (!target.empty() && target.back() == '/') {
        return target + network::url_encode(name) + network::kDigestSuffix;
    }
    return target + network::kDigestSuffix;
}

// First byte of "bytes N-M/T".
std::optional<uint64_t> content_range_start(const std::string& value) {
    const auto space = value.find(' ');
    const auto dash = value.find('-');
    if (space == std::string::npos || dash == std::string::npos || dash <= space + 1) {
        return std::nullopt;
    }
    const std::string digits = value.substr(space + 1, dash - space - 1);
    if (digits.size() > 19 || !std::all_of(digits.begin(), digits.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::nullopt;
    }
    return std::stoull(digits);
}

} // namespace

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Requesting: return "requesting";
        case Phase::Streaming: return "downloading";
        case Phase::Renaming: return "renaming";
        case Phase::FetchingDigest: return "fetching digest";
        case Phase::DigestPending: return "waiting for digest";
        case Phase::ComputingDigest: return "verifying";
        case Phase::Verifying: return "comparing digests";
        case Phase::Done: return "done";
        case Phase::Failed: return "failed";
    }
    return "unknown";
}

EngineConfig EngineConfig::from(const DownloadConfig& config) {
    EngineConfig engine;
    engine.chunk_size = config.chunk_size;
    engine.tick_interval = config.tick_interval;
    engine.digest_retry_interval = config.digest_retry_interval;
    engine.max_digest_attempts = config.max_digest_attempts;
    engine.io_threads = config.io_threads;
    return engine;
}

DownloadEngine::DownloadEngine(DownloadRequest request, EngineConfig config)
    : request_(std::move(request))
    , config_(config)
    , client_(config_.connect_timeout, config_.idle_timeout)
    , tick_timer_(io_)
    , retry_timer_(io_) {
    session_.target_url = request_.url;
    session_.local_filename = request_.local_filename;
    session_.partial_filename = partial_path_for(request_.local_filename);
    session_.resume_offset = request_.resume_offset;
    session_.bytes_transferred = request_.resume_offset;
    buffer_.resize(std::max<std::size_t>(config_.chunk_size, 1));
}

DownloadEngine::~DownloadEngine() {
    if (stream_) {
        stream_->abort();
    }
    work_.reset();
    io_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void DownloadEngine::set_progress_observer(ProgressObserver observer) {
    observer_ = std::move(observer);
}

void DownloadEngine::cancel() {
    queue_.push(CancelRequested{});
}

DownloadOutcome DownloadEngine::run() {
    if (started_) {
        return Err<DownloadReport>(ErrorKind::Config, "download engine can only run once");
    }
    started_ = true;

    auto url = network::Url::parse(request_.url);
    if (url.is_error()) {
        return Err<DownloadReport, Error>(url.error());
    }
    file_url_ = url.value();
    digest_url_ = file_url_.with_target(
        digest_target(file_url_.target, request_.local_filename.filename().string()));

    started_at_ = std::chrono::steady_clock::now();
    last_sample_at_ = started_at_;
    last_sample_bytes_ = session_.bytes_transferred;

    work_.emplace(asio::make_work_guard(io_));
    const std::size_t thread_count = std::max<std::size_t>(config_.io_threads, 1);
    for (std::size_t i = 0; i < thread_count; ++i) {
        io_threads_.emplace_back([this]() {
            io_.run();
        });
    }

    spdlog::info("Downloading {} to {}", file_url_.to_string(), session_.local_filename.string());
    if (session_.resume_offset > 0) {
        spdlog::info("Resuming from byte {}", session_.resume_offset);
    }

    arm_tick();
    start_request();

    while (!is_terminal(session_.phase) || busy_) {
        auto event = queue_.pop();
        if (!event) {
            break;
        }
        std::visit([this](auto& e) { on_event(e); }, *event);
    }

    tick_timer_.cancel();
    retry_timer_.cancel();
    work_.reset();
    io_.stop();
    for (auto& thread : io_threads_) {
        thread.join();
    }
    io_threads_.clear();
    queue_.close();

    if (session_.phase == Phase::Done && report_) {
        return Ok(*report_);
    }
    return Err<DownloadReport, Error>(
        session_.error.value_or(Error{ErrorKind::Protocol, "download ended without a result"}));
}

template<typename Task>
void DownloadEngine::dispatch(Task task) {
    busy_ = true;
    asio::post(io_, [this, task = std::move(task)]() mutable {
        queue_.push(task());
    });
}

// ──────────────────────────────────────────────────────────
// Requesting / Streaming
// ──────────────────────────────────────────────────────────

void DownloadEngine::start_request() {
    set_phase(Phase::Requesting);

    network::HeaderMap headers;
    headers[network::kUserHeader] = request_.username;
    if (session_.resume_offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(session_.resume_offset) + "-";
    }

    stream_ = client_.open_stream();
    network::HttpBodyStream* stream = stream_.get();
    dispatch([this, stream, headers]() {
        return EngineEvent(ResponseReady{client_.start_get(*stream, file_url_, headers)});
    });
}

void DownloadEngine::on_event(ResponseReady& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }

    const auto& head = stream_->head();
    const int status = head.status_code;
    const int64_t length = head.content_length();
    const uint64_t offset = session_.resume_offset;

    if (offset > 0 && status == 206) {
        const std::string content_range = head.get_header("Content-Range");
        const auto start = content_range_start(content_range);
        if (start && *start != offset) {
            fail(ErrorKind::Protocol, "asked for byte " + std::to_string(offset) +
                                      " but the server sent " + content_range);
            return;
        }
        if (length >= 0) {
            session_.total_bytes = length + static_cast<int64_t>(offset);
        } else if (auto total = network::parse_content_range_total(content_range)) {
            session_.total_bytes = static_cast<int64_t>(*total);
        }
        begin_streaming(false);
        return;
    }

    if (status == 200) {
        if (offset > 0) {
            spdlog::warn("Server ignored the range request; restarting {} from byte 0",
                         session_.local_filename.filename().string());
            session_.range_downgraded = true;
            session_.resume_offset = 0;
            session_.bytes_transferred = 0;
            last_sample_bytes_ = 0;
        }
        session_.total_bytes = length;
        begin_streaming(true);
        return;
    }

    if (offset > 0 && status == 416) {
        const auto total = network::parse_content_range_total(head.get_header("Content-Range"));
        stream_.reset();
        if (total && *total == offset) {
            spdlog::info("{} already holds all {} bytes", session_.partial_filename.string(), offset);
            session_.total_bytes = static_cast<int64_t>(offset);
            start_rename();
        } else {
            fail(ErrorKind::Protocol, "server refused to resume at byte " + std::to_string(offset));
        }
        return;
    }

    fail(ErrorKind::Protocol, "unexpected status " + std::to_string(status) + " from " + file_url_.to_string());
}

void DownloadEngine::begin_streaming(bool truncate) {
    const auto mode = std::ios::binary | std::ios::out | (truncate ? std::ios::trunc : std::ios::app);
    partial_out_.open(session_.partial_filename, mode);
    if (!partial_out_) {
        fail(ErrorKind::Filesystem, "cannot open " + session_.partial_filename.string() + " for writing");
        return;
    }
    set_phase(Phase::Streaming);
    start_read();
}

void DownloadEngine::start_read() {
    network::HttpBodyStream* stream = stream_.get();
    dispatch([this, stream]() {
        return EngineEvent(BodyRead{stream->read_some(buffer_.data(), buffer_.size())});
    });
}

void DownloadEngine::on_event(BodyRead& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }

    const std::size_t n = event.result.value();
    if (n > 0) {
        start_write(n);
        return;
    }

    // End of body.
    stream_.reset();
    partial_out_.close();
    if (partial_out_.fail()) {
        fail(ErrorKind::Filesystem, "cannot finish writing " + session_.partial_filename.string());
        return;
    }
    if (session_.total_bytes >= 0 &&
        session_.bytes_transferred != static_cast<uint64_t>(session_.total_bytes)) {
        fail(ErrorKind::Transport, "body ended after " + std::to_string(session_.bytes_transferred) +
                                   " of " + std::to_string(session_.total_bytes) + " bytes");
        return;
    }
    start_rename();
}

void DownloadEngine::start_write(std::size_t length) {
    dispatch([this, length]() {
        partial_out_.write(buffer_.data(), static_cast<std::streamsize>(length));
        partial_out_.flush();
        if (!partial_out_) {
            return EngineEvent(ChunkWritten{
                Err<void>(ErrorKind::Filesystem, "write to " + session_.partial_filename.string() + " failed"),
                length});
        }
        return EngineEvent(ChunkWritten{Ok(), length});
    });
}

void DownloadEngine::on_event(ChunkWritten& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }
    session_.bytes_transferred += event.length;
    start_read();
}

// ──────────────────────────────────────────────────────────
// Renaming
// ──────────────────────────────────────────────────────────

void DownloadEngine::start_rename() {
    set_phase(Phase::Renaming);
    dispatch([from = session_.partial_filename, to = session_.local_filename]() {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            return EngineEvent(RenameDone{
                Err<void>(ErrorKind::Filesystem,
                          "cannot rename " + from.string() + " to " + to.string() + ": " + ec.message())});
        }
        return EngineEvent(RenameDone{Ok()});
    });
}

void DownloadEngine::on_event(RenameDone& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }
    spdlog::info("Saved {} ({} bytes)", session_.local_filename.string(), session_.bytes_transferred);
    start_digest_fetch();
}

// ──────────────────────────────────────────────────────────
// FetchingDigest / DigestPending
// ──────────────────────────────────────────────────────────

void DownloadEngine::start_digest_fetch() {
    set_phase(Phase::FetchingDigest);
    ++session_.digest_attempts;

    network::HeaderMap headers;
    headers[network::kUserHeader] = request_.username;

    stream_ = client_.open_stream();
    network::HttpBodyStream* stream = stream_.get();
    dispatch([this, stream, headers]() {
        if (auto res = client_.start_get(*stream, digest_url_, headers); res.is_error()) {
            return EngineEvent(DigestFetched{Err<DigestReply, Error>(res.error())});
        }
        DigestReply reply;
        reply.status = stream->status_code();
        if (reply.status == 200) {
            auto body = stream->read_all(kMaxDigestBody);
            if (body.is_error()) {
                return EngineEvent(DigestFetched{Err<DigestReply, Error>(body.error())});
            }
            reply.body = std::move(body.value());
        }
        return EngineEvent(DigestFetched{Ok(std::move(reply))});
    });
}

void DownloadEngine::on_event(DigestFetched& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    stream_.reset();
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }

    const DigestReply& reply = event.result.value();
    if (reply.status == 503) {
        if (config_.max_digest_attempts > 0 && session_.digest_attempts >= config_.max_digest_attempts) {
            fail(ErrorKind::Protocol, "digest still unavailable after " +
                                      std::to_string(session_.digest_attempts) + " attempts");
            return;
        }
        spdlog::debug("Digest not ready yet (attempt {})", session_.digest_attempts);
        set_phase(Phase::DigestPending);
        arm_retry();
        return;
    }

    if (reply.status != 200) {
        fail(ErrorKind::Protocol, "digest request to " + digest_url_.to_string() +
                                  " returned status " + std::to_string(reply.status));
        return;
    }

    const std::string digest = trim(reply.body);
    if (!hash::is_valid_digest(digest)) {
        fail(ErrorKind::Protocol, "malformed digest from server (" + std::to_string(digest.size()) +
                                  " characters, expected " + std::to_string(hash::kDigestHexLength) + ")");
        return;
    }
    session_.remote_digest = digest;
    spdlog::debug("Remote digest {}", digest);
    begin_hashing();
}

void DownloadEngine::on_event(RetryElapsed&) {
    if (is_terminal(session_.phase) || session_.phase != Phase::DigestPending) {
        return;
    }
    start_digest_fetch();
}

// ──────────────────────────────────────────────────────────
// ComputingDigest / Verifying
// ──────────────────────────────────────────────────────────

void DownloadEngine::begin_hashing() {
    set_phase(Phase::ComputingDigest);

    std::error_code ec;
    const auto size = fs::file_size(session_.local_filename, ec);
    if (ec) {
        fail(ErrorKind::Filesystem, "cannot stat " + session_.local_filename.string() + ": " + ec.message());
        return;
    }
    verify_in_.open(session_.local_filename, std::ios::binary);
    if (!verify_in_) {
        fail(ErrorKind::Filesystem, "cannot open " + session_.local_filename.string() + " for reading");
        return;
    }

    session_.verify_total_bytes = static_cast<uint64_t>(size);
    session_.verified_bytes = 0;
    session_.bytes_per_second = 0.0;
    last_sample_bytes_ = 0;
    hasher_.reset();
    start_verify_read();
}

void DownloadEngine::start_verify_read() {
    dispatch([this]() {
        verify_in_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (verify_in_.bad() || (verify_in_.fail() && !verify_in_.eof())) {
            return EngineEvent(FileChunkRead{
                Err<std::size_t>(ErrorKind::Filesystem, "read of " + session_.local_filename.string() + " failed")});
        }
        return EngineEvent(FileChunkRead{Ok(static_cast<std::size_t>(verify_in_.gcount()))});
    });
}

void DownloadEngine::on_event(FileChunkRead& event) {
    busy_ = false;
    if (finish_if_cancelled()) {
        return;
    }
    if (event.result.is_error()) {
        fail(event.result.error());
        return;
    }

    const std::size_t n = event.result.value();
    if (n == 0) {
        verify_in_.close();
        session_.local_digest = hasher_.finalize();
        verify();
        return;
    }
    hasher_.update(buffer_.data(), n);
    session_.verified_bytes += n;
    start_verify_read();
}

void DownloadEngine::verify() {
    set_phase(Phase::Verifying);

    if (session_.local_digest == session_.remote_digest) {
        complete();
        return;
    }

    std::error_code ec;
    fs::remove(session_.local_filename, ec);
    if (ec) {
        spdlog::error("Cannot delete corrupted {}: {}", session_.local_filename.string(), ec.message());
    } else {
        spdlog::warn("Deleted corrupted {}", session_.local_filename.string());
    }
    fail(ErrorKind::Integrity, "digest mismatch for " + session_.local_filename.filename().string() +
                               ": expected " + session_.remote_digest +
                               ", computed " + session_.local_digest);
}

// ──────────────────────────────────────────────────────────
// Timers and cancellation
// ──────────────────────────────────────────────────────────

void DownloadEngine::arm_tick() {
    tick_timer_.expires_after(config_.tick_interval);
    tick_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        queue_.push(Tick{});
    });
}

void DownloadEngine::arm_retry() {
    retry_timer_.expires_after(config_.digest_retry_interval);
    retry_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        queue_.push(RetryElapsed{});
    });
}

void DownloadEngine::on_event(Tick&) {
    if (is_terminal(session_.phase)) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    const bool hashing = session_.phase == Phase::ComputingDigest || session_.phase == Phase::Verifying;
    const uint64_t counter = hashing ? session_.verified_bytes : session_.bytes_transferred;
    if (counter < last_sample_bytes_) {
        last_sample_bytes_ = counter;
    }

    const double seconds = std::chrono::duration<double>(now - last_sample_at_).count();
    if (seconds > 0.0) {
        const double instant = static_cast<double>(counter - last_sample_bytes_) / seconds;
        session_.bytes_per_second = session_.bytes_per_second == 0.0
            ? instant
            : 0.7 * session_.bytes_per_second + 0.3 * instant;
    }
    last_sample_at_ = now;
    last_sample_bytes_ = counter;

    notify();
    arm_tick();
}

void DownloadEngine::on_event(CancelRequested&) {
    if (is_terminal(session_.phase) || cancel_requested_) {
        return;
    }
    cancel_requested_ = true;
    spdlog::info("Cancelling download of {}", session_.local_filename.filename().string());
    retry_timer_.cancel();

    if (busy_) {
        // The outstanding task reports back, then finish_if_cancelled() ends the run.
        if (stream_) {
            stream_->abort();
        }
        return;
    }
    finish_if_cancelled();
}

bool DownloadEngine::finish_if_cancelled() {
    if (!cancel_requested_) {
        return false;
    }
    fail(ErrorKind::Cancelled, "download of " + session_.local_filename.filename().string() + " cancelled");
    return true;
}

// ──────────────────────────────────────────────────────────
// Terminal states
// ──────────────────────────────────────────────────────────

void DownloadEngine::complete() {
    DownloadReport report;
    report.final_path = session_.local_filename;
    report.bytes = session_.verify_total_bytes;
    report.resumed_from = request_.resume_offset;
    report.digest = session_.local_digest;
    report.range_downgraded = session_.range_downgraded;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    report_ = report;

    release_handles();
    tick_timer_.cancel();
    spdlog::info("Verified {} ({})", session_.local_filename.string(), session_.local_digest);
    set_phase(Phase::Done);
}

void DownloadEngine::fail(ErrorKind kind, std::string message) {
    fail(Error{kind, std::move(message)});
}

void DownloadEngine::fail(Error error) {
    if (is_terminal(session_.phase)) {
        return;
    }
    if (error.kind == ErrorKind::Cancelled) {
        spdlog::info("{}", error.message);
    } else {
        spdlog::error("Download failed in phase '{}': {}", to_string(session_.phase), error.describe());
    }
    session_.error = std::move(error);
    release_handles();
    tick_timer_.cancel();
    retry_timer_.cancel();
    set_phase(Phase::Failed);
}

void DownloadEngine::release_handles() {
    stream_.reset();
    if (partial_out_.is_open()) {
        partial_out_.close();
    }
    if (verify_in_.is_open()) {
        verify_in_.close();
    }
}

void DownloadEngine::set_phase(Phase phase) {
    if (session_.phase == phase) {
        return;
    }
    spdlog::debug("Phase {} -> {}", to_string(session_.phase), to_string(phase));
    session_.phase = phase;
    notify();
}

void DownloadEngine::notify() {
    if (observer_) {
        observer_(snapshot());
    }
}

DownloadSnapshot DownloadEngine::snapshot() const {
    DownloadSnapshot s;
    s.phase = session_.phase;
    s.total_bytes = session_.total_bytes;
    s.bytes_transferred = session_.bytes_transferred;
    s.resume_offset = session_.resume_offset;
    s.verified_bytes = session_.verified_bytes;
    s.verify_total_bytes = session_.verify_total_bytes;
    s.digest_attempts = session_.digest_attempts;
    s.bytes_per_second = session_.bytes_per_second;
    s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);

    if (session_.bytes_per_second > 0.0) {
        double left = -1.0;
        if (session_.phase == Phase::Streaming && session_.total_bytes >= 0) {
            left = static_cast<double>(session_.total_bytes) - static_cast<double>(session_.bytes_transferred);
        } else if (session_.phase == Phase::ComputingDigest) {
            left = static_cast<double>(session_.verify_total_bytes - session_.verified_bytes);
        }
        if (left >= 0.0) {
            s.remaining = std::chrono::seconds(static_cast<int64_t>(left / session_.bytes_per_second));
        }
    }
    return s;
}

} // namespace pushpop::transfer
