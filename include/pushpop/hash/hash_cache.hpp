#pragma once

#include "pushpop/core/result.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace pushpop::hash {

enum class HashStatus {
    Pending,  // computation in flight, ask again later
    Ready,    // digest available
    Failed    // computation finished with an error
};

struct HashLookup {
    HashStatus status = HashStatus::Pending;
    std::string digest;          ///< Set when status == Ready
    std::optional<Error> error;  ///< Set when status == Failed
};

/**
 * @brief Single-flight digest cache for files shared by the sender
 *
 * The first request for a path installs an entry and starts one
 * background computation; every later request either gets the published
 * result or learns that it is still pending. At most one computation runs
 * per path, and a published result is kept for the lifetime of the cache
 * (shared files are assumed immutable while shared).
 *
 * THREAD SAFETY:
 * - All methods may be called concurrently
 * - request() never blocks on a computation (safe from I/O threads)
 * - blocking_get() waits on the entry's condition variable
 *
 * The cache owns one thread per computation. Threads that have finished
 * are joined when the next computation starts; the rest are joined on
 * destruction.
 */
class HashCache {
public:
    explicit HashCache(std::size_t chunk_size = 128 * 1024);
    ~HashCache();

    HashCache(const HashCache&) = delete;
    HashCache& operator=(const HashCache&) = delete;

    /**
     * @brief Non-blocking lookup; starts the computation on first use
     */
    HashLookup request(const std::filesystem::path& path);

    /**
     * @brief Wait until the digest for @p path is published
     */
    Result<std::string> blocking_get(const std::filesystem::path& path);

    /**
     * @brief Start hashing @p path in the background if not done yet
     */
    void prefetch(const std::filesystem::path& path);

    /// Number of hash passes started since construction.
    std::size_t computations() const { return computations_.load(std::memory_order_relaxed); }

    /// Worker threads not yet joined.
    std::size_t worker_threads() const;

private:
    struct Entry {
        std::optional<std::string> digest;
        std::optional<Error> error;
        bool in_flight = false;
        std::condition_variable done;
    };

    static std::string make_key(const std::filesystem::path& path);

    // Caller holds mutex_.
    std::shared_ptr<Entry> acquire_locked(const std::string& key);
    void reap_finished_locked();

    void compute(std::string key, std::shared_ptr<Entry> entry);

    std::size_t chunk_size_;
    std::atomic<std::size_t> computations_{0};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> finished_;
};

} // namespace pushpop::hash
