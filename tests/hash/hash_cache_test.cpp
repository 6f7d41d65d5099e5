#include "pushpop/hash/hash_cache.hpp"

#include "../test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace pushpop;
using namespace pushpop::hash;
using pushpop::testing::create_temp_dir;
using pushpop::testing::make_payload;
using pushpop::testing::sha256_hex;
using pushpop::testing::write_file;

namespace {

// Poll request() until the computation settles.
HashLookup wait_for_result(HashCache& cache, const std::filesystem::path& path) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    HashLookup lookup = cache.request(path);
    while (lookup.status == HashStatus::Pending && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        lookup = cache.request(path);
    }
    return lookup;
}

} // namespace

TEST(HashCacheTest, BlockingGetReturnsDigest) {
    const auto dir = create_temp_dir("cache_blocking");
    const auto file = dir / "file.bin";
    const std::string data = make_payload(200 * 1024);
    write_file(file, data);

    HashCache cache;
    auto digest = cache.blocking_get(file);
    ASSERT_TRUE(digest.is_ok()) << digest.error().message;
    EXPECT_EQ(digest.value(), sha256_hex(data));
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(HashCacheTest, RequestIsPendingThenReady) {
    const auto dir = create_temp_dir("cache_request");
    const auto file = dir / "file.bin";
    const std::string data = make_payload(64 * 1024);
    write_file(file, data);

    HashCache cache;
    const HashLookup first = cache.request(file);
    EXPECT_NE(first.status, HashStatus::Failed);

    const HashLookup settled = wait_for_result(cache, file);
    ASSERT_EQ(settled.status, HashStatus::Ready);
    EXPECT_EQ(settled.digest, sha256_hex(data));
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(HashCacheTest, ConcurrentRequestersShareOneComputation) {
    const auto dir = create_temp_dir("cache_single_flight");
    const auto file = dir / "big.bin";
    const std::string data = make_payload(4 * 1024 * 1024);
    write_file(file, data);

    HashCache cache(16 * 1024);
    constexpr int kThreads = 16;
    std::vector<std::string> results(kThreads);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&cache, &file, &results, i]() {
            if (i % 2 == 0) {
                auto digest = cache.blocking_get(file);
                results[i] = digest.is_ok() ? digest.value() : "error";
            } else {
                results[i] = wait_for_result(cache, file).digest;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(cache.computations(), 1u);
    const std::string expected = sha256_hex(data);
    for (const auto& digest : results) {
        EXPECT_EQ(digest, expected);
    }
}

TEST(HashCacheTest, EquivalentPathsShareAnEntry) {
    const auto dir = create_temp_dir("cache_paths");
    const auto file = dir / "file.bin";
    write_file(file, "contents");

    HashCache cache;
    ASSERT_TRUE(cache.blocking_get(file).is_ok());
    ASSERT_TRUE(cache.blocking_get(dir / "." / "file.bin").is_ok());
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(HashCacheTest, PrefetchStartsComputation) {
    const auto dir = create_temp_dir("cache_prefetch");
    const auto file = dir / "file.bin";
    write_file(file, "warm me up");

    HashCache cache;
    cache.prefetch(file);
    EXPECT_EQ(cache.computations(), 1u);

    auto digest = cache.blocking_get(file);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), sha256_hex("warm me up"));
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(HashCacheTest, FailureIsPublishedAndNotRetried) {
    const auto dir = create_temp_dir("cache_failure");
    const auto missing = dir / "missing.bin";

    HashCache cache;
    auto digest = cache.blocking_get(missing);
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, ErrorKind::Filesystem);

    const HashLookup lookup = cache.request(missing);
    EXPECT_EQ(lookup.status, HashStatus::Failed);
    ASSERT_TRUE(lookup.error.has_value());

    // The file appearing later does not trigger a second pass.
    write_file(missing, "late");
    EXPECT_EQ(cache.request(missing).status, HashStatus::Failed);
    EXPECT_EQ(cache.computations(), 1u);
}

TEST(HashCacheTest, FinishedWorkersAreJoined) {
    const auto dir = create_temp_dir("cache_reap");
    HashCache cache(4096);

    for (int i = 0; i < 5; ++i) {
        const auto file = dir / ("file" + std::to_string(i) + ".bin");
        write_file(file, make_payload(8 * 1024, static_cast<uint32_t>(i)));
        ASSERT_TRUE(cache.blocking_get(file).is_ok());
    }

    // Each new computation joins the ones that already published.
    EXPECT_EQ(cache.computations(), 5u);
    EXPECT_EQ(cache.worker_threads(), 1u);
    std::filesystem::remove_all(dir);
}
