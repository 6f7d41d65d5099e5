#include "pushpop/hash/content_hasher.hpp"

#include "../test_helpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace pushpop;
using namespace pushpop::hash;
using pushpop::testing::create_temp_dir;
using pushpop::testing::make_payload;
using pushpop::testing::write_file;

TEST(ContentHasherTest, KnownVectors) {
    ContentHasher hasher;
    EXPECT_EQ(hasher.finalize(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    hasher.update("abc", 3);
    EXPECT_EQ(hasher.finalize(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ContentHasherTest, IncrementalMatchesOneShot) {
    const std::string data = make_payload(10000);

    ContentHasher whole;
    whole.update(data.data(), data.size());

    ContentHasher pieces;
    for (std::size_t pos = 0; pos < data.size(); pos += 777) {
        pieces.update(data.data() + pos, std::min<std::size_t>(777, data.size() - pos));
    }

    EXPECT_EQ(whole.finalize(), pieces.finalize());
}

TEST(ContentHasherTest, FileDigestIsDeterministic) {
    const auto dir = create_temp_dir("hasher");
    const auto file = dir / "data.bin";
    write_file(file, make_payload(300 * 1024));

    auto first = hash_file(file, 4096);
    auto second = hash_file(file, 64 * 1024);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value().size(), kDigestHexLength);
}

TEST(ContentHasherTest, FileDigestReportsProgress) {
    const auto dir = create_temp_dir("hasher_progress");
    const auto file = dir / "data.bin";
    write_file(file, make_payload(10000));

    std::vector<uint64_t> seen;
    uint64_t seen_total = 0;
    auto digest = hash_file(file, 4096, [&](uint64_t processed, uint64_t total) {
        seen.push_back(processed);
        seen_total = total;
    });

    ASSERT_TRUE(digest.is_ok());
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), 10000u);
    EXPECT_EQ(seen_total, 10000u);
}

TEST(ContentHasherTest, MissingFileIsFilesystemError) {
    const auto dir = create_temp_dir("hasher_missing");
    auto digest = hash_file(dir / "absent.bin");
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, ErrorKind::Filesystem);
}

TEST(ContentHasherTest, DigestValidation) {
    EXPECT_TRUE(is_valid_digest(std::string(64, 'a')));
    EXPECT_TRUE(is_valid_digest("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    EXPECT_FALSE(is_valid_digest(std::string(63, 'a')));
    EXPECT_FALSE(is_valid_digest(std::string(65, 'a')));
    EXPECT_FALSE(is_valid_digest(std::string(64, 'g')));
    EXPECT_FALSE(is_valid_digest(""));
}
