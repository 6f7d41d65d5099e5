#include "pushpop/hash/hash_cache.hpp"

#include "pushpop/hash/content_hasher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace pushpop::hash {
namespace fs = std::filesystem;

HashCache::HashCache(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 128 * 1024 : chunk_size) {
}

HashCache::~HashCache() {
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::string HashCache::make_key(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

std::shared_ptr<HashCache::Entry> HashCache::acquire_locked(const std::string& key) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    auto entry = std::make_shared<Entry>();
    entry->in_flight = true;
    entries_.emplace(key, entry);
    computations_.fetch_add(1, std::memory_order_relaxed);
    reap_finished_locked();
    workers_.emplace_back(&HashCache::compute, this, key, entry);
    return entry;
}

void HashCache::reap_finished_locked() {
    // A listed thread has already left its critical section; join() only
    // waits for it to return.
    for (const auto& id : finished_) {
        auto it = std::find_if(workers_.begin(), workers_.end(),
            [&id](const std::thread& worker) { return worker.get_id() == id; });
        if (it != workers_.end()) {
            it->join();
            workers_.erase(it);
        }
    }
    finished_.clear();
}

std::size_t HashCache::worker_threads() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

HashLookup HashCache::request(const fs::path& path) {
    const auto key = make_key(path);

    std::lock_guard lock(mutex_);
    auto entry = acquire_locked(key);

    HashLookup lookup;
    if (entry->in_flight) {
        lookup.status = HashStatus::Pending;
    } else if (entry->error) {
        lookup.status = HashStatus::Failed;
        lookup.error = entry->error;
    } else {
        lookup.status = HashStatus::Ready;
        lookup.digest = *entry->digest;
    }
    return lookup;
}

Result<std::string> HashCache::blocking_get(const fs::path& path) {
    const auto key = make_key(path);

    std::unique_lock lock(mutex_);
    auto entry = acquire_locked(key);
    entry->done.wait(lock, [&entry]() { return !entry->in_flight; });

    if (entry->error) {
        return Err<std::string, Error>(*entry->error);
    }
    return Ok(*entry->digest);
}

void HashCache::prefetch(const fs::path& path) {
    const auto key = make_key(path);
    std::lock_guard lock(mutex_);
    acquire_locked(key);
}

void HashCache::compute(std::string key, std::shared_ptr<Entry> entry) {
    spdlog::debug("Hashing {}", key);
    const auto started = std::chrono::steady_clock::now();

    Result<std::string> result = Err<std::string>(ErrorKind::Filesystem, "not computed");
    try {
        result = hash_file(key, chunk_size_);
    } catch (const std::exception& e) {
        result = Err<std::string>(ErrorKind::Filesystem, std::string("hashing failed: ") + e.what());
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard lock(mutex_);
        if (result.is_ok()) {
            entry->digest = result.value();
            spdlog::info("Digest for {} ready in {} ms: {}", key, elapsed.count(), result.value());
        } else {
            entry->error = result.error();
            spdlog::error("Digest for {} failed: {}", key, result.error().message);
        }
        entry->in_flight = false;
        finished_.push_back(std::this_thread::get_id());
    }
    entry->done.notify_all();
}

} // namespace pushpop::hash
