/**
 * @file test_cloud_utils.cpp
 * @brief Unit tests for hashing, encoding and time helpers
 */

#include <gtest/gtest.h>

#include "kcenon/stylize/cloud/cloud_utils.h"

#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::stylize {
namespace {

using namespace cloud_utils;

// ============================================================================
// Hashing
// ============================================================================

class HashingTest : public ::testing::Test {};

TEST_F(HashingTest, EmptyStringDigestEqualsEmptyPayloadConstant) {
    EXPECT_EQ(sha256_hex(std::string{}), EMPTY_PAYLOAD_SHA256);
}

TEST_F(HashingTest, EmptyByteBufferDigestEqualsEmptyPayloadConstant) {
    std::vector<uint8_t> empty;
    EXPECT_EQ(sha256_hex(std::span<const uint8_t>(empty)), EMPTY_PAYLOAD_SHA256);
}

TEST_F(HashingTest, KnownDigest) {
    EXPECT_EQ(sha256_hex(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HashingTest, ByteAndStringDigestsAgree) {
    std::string text = "Welcome to Amazon S3.";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(sha256_hex(std::span<const uint8_t>(bytes)), sha256_hex(text));
    EXPECT_EQ(sha256_hex(text),
              "44ce7dd67c959e0d3524ffac1771dfbba87d2b6b4b4e99e42034a8b803f8b072");
}

TEST_F(HashingTest, StreamDigestMatchesStringDigest) {
    std::string text(200000, 'x');
    std::istringstream stream(text);

    auto digest = sha256_hex(stream);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), sha256_hex(text));
}

TEST_F(HashingTest, EmptyStreamDigestEqualsEmptyPayloadConstant) {
    std::istringstream stream;
    auto digest = sha256_hex(stream);
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(digest.value(), EMPTY_PAYLOAD_SHA256);
}

TEST_F(HashingTest, HmacRfc4231TestCase2) {
    auto mac = hmac_sha256(std::string("Jefe"), "what do ya want for nothing?");
    EXPECT_EQ(bytes_to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(HashingTest, HmacIsRawThirtyTwoBytes) {
    auto mac = hmac_sha256(std::string("key"), "data");
    EXPECT_EQ(mac.size(), 32u);
}

// ============================================================================
// Encoding
// ============================================================================

class EncodingTest : public ::testing::Test {};

TEST_F(EncodingTest, ObjectKeyKeepsSlashesAndEscapesReserved) {
    EXPECT_EQ(encode_object_key("a b/c#d"), "a%20b/c%23d");
}

TEST_F(EncodingTest, ObjectKeyUnreservedCharactersUnchanged) {
    EXPECT_EQ(encode_object_key("uploads/abc-123_x.y~z.png"), "uploads/abc-123_x.y~z.png");
}

TEST_F(EncodingTest, ObjectKeyEmptySegmentsPreserved) {
    EXPECT_EQ(encode_object_key("a//b/"), "a//b/");
}

TEST_F(EncodingTest, ObjectKeyEscapesDollarAndPlus) {
    EXPECT_EQ(encode_object_key("test$file+1.text"), "test%24file%2B1.text");
}

TEST_F(EncodingTest, ObjectKeyEscapesUtf8Bytes) {
    EXPECT_EQ(encode_object_key("caf\xC3\xA9"), "caf%C3%A9");
}

TEST_F(EncodingTest, UrlEncodeEscapesSlashByDefault) {
    EXPECT_EQ(url_encode("a/b"), "a%2Fb");
    EXPECT_EQ(url_encode("a/b", false), "a/b");
}

TEST_F(EncodingTest, TrimAndLower) {
    EXPECT_EQ(trim("  bucket \t\n"), "bucket");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("X-Amz-Meta-Foo"), "x-amz-meta-foo");
}

// ============================================================================
// Time
// ============================================================================

class TimeFormatTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point when_ =
        std::chrono::system_clock::from_time_t(1369353600);  // 2013-05-24T00:00:00Z
};

TEST_F(TimeFormatTest, AmzDate) {
    EXPECT_EQ(format_amz_date(when_), "20130524T000000Z");
}

TEST_F(TimeFormatTest, DateStamp) {
    EXPECT_EQ(format_date_stamp(when_ + std::chrono::hours(23)), "20130524");
}

TEST_F(TimeFormatTest, ParseRoundTrip) {
    auto parsed = parse_amz_date("20130524T000000Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), when_);
}

TEST_F(TimeFormatTest, ParseRejectsMalformed) {
    EXPECT_FALSE(parse_amz_date("2013-05-24").has_value());
}

// ============================================================================
// Misc
// ============================================================================

TEST(CloudUtilsTest, GenerateUuidIsVersion4) {
    static const std::regex uuid_pattern(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    auto a = generate_uuid();
    auto b = generate_uuid();
    EXPECT_TRUE(std::regex_match(a, uuid_pattern)) << a;
    EXPECT_NE(a, b);
}

TEST(CloudUtilsTest, DetectContentType) {
    EXPECT_EQ(detect_content_type("cat.png"), "image/png");
    EXPECT_EQ(detect_content_type("photo.JPEG"), "image/jpeg");
    EXPECT_EQ(detect_content_type("README"), "application/octet-stream");
    EXPECT_EQ(detect_content_type("archive.xyz"), "application/octet-stream");
}

}  // namespace
}  // namespace kcenon::stylize
