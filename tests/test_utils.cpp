// =============================================================================
// Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include <chunkguard/core/utils.hpp>

#include <set>
#include <string>

using namespace chunkguard;

TEST(TimeUtilsTest, FormatsUtcIso8601) {
    EXPECT_EQ(format_timestamp_ms(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp_ms(1700000000000LL), "2023-11-14T22:13:20Z");
    // Milliseconds are dropped
    EXPECT_EQ(format_timestamp_ms(1700000000999LL), "2023-11-14T22:13:20Z");
}

TEST(TimeUtilsTest, CurrentTimeFormatsToSameShape) {
    std::string now = format_timestamp_ms(current_timestamp_ms());
    ASSERT_EQ(now.size(), 20u);
    EXPECT_EQ(now[10], 'T');
    EXPECT_EQ(now.back(), 'Z');
}

TEST(StringUtilsTest, SplitKeepsTrailingEmptyPart) {
    std::vector<std::string> parts = split("a\nb\n", '\n');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "");
}

TEST(StringUtilsTest, FormatSize) {
    EXPECT_EQ(format_size(512), "512 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(2 * 1024 * 1024), "2.00 MB");
}

TEST(Utf8UtilsTest, RejectsOverlongsAndSurrogates) {
    const unsigned char overlong[] = {0xC0, 0xAF};
    const unsigned char surrogate[] = {0xED, 0xA0, 0x80};
    const unsigned char euro[] = {0xE2, 0x82, 0xAC};

    EXPECT_FALSE(is_valid_utf8(overlong, sizeof(overlong)));
    EXPECT_FALSE(is_valid_utf8(surrogate, sizeof(surrogate)));
    EXPECT_TRUE(is_valid_utf8(euro, sizeof(euro)));
    EXPECT_EQ(utf8_sequence_length(euro, 2, 0), 0u);
}

TEST(Utf8UtilsTest, AppendEncodesEveryWidth) {
    std::string out;
    append_utf8(out, 'A');
    append_utf8(out, 0xE9);
    append_utf8(out, 0x20AC);
    append_utf8(out, 0x1F600);
    EXPECT_EQ(out, "A\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
}

TEST(RandomUtilsTest, Base36Alphabet) {
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        std::string id = random_base36(12);
        ASSERT_EQ(id.size(), 12u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdefghijklmnopqrstuvwxyz"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 20u);
}
