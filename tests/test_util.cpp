/// @file test_util.cpp
/// Unit tests for util.hpp: URL handling, backoff, HTTP-date and base64.

#include "util.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace memclient;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:8080/api/v1/memories");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.target, "/api/v1/memories");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
    EXPECT_EQ(parts.target, "/api");
}

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://memories.example.com/v1/keys/ns");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "memories.example.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/v1/keys/ns");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://example.com");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, QueryIsPartOfTarget) {
    auto parts = parseUrl("http://example.com/api/v1/memories?namespace=a");
    EXPECT_EQ(parts.target, "/api/v1/memories?namespace=a");
}

TEST(ParseUrl, QueryWithoutPathGetsLeadingSlash) {
    auto parts = parseUrl("http://example.com?x=1");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.target, "/?x=1");
}

TEST(ParseUrl, FragmentIsDropped) {
    auto parts = parseUrl("http://example.com/docs#section");
    EXPECT_EQ(parts.target, "/docs");
}

TEST(ParseUrl, SchemeIsCaseInsensitive) {
    auto parts = parseUrl("HTTPS://example.com/");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.port, "443");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("localhost:8080/api"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/file"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///api"), std::invalid_argument);
}

TEST(ParseUrl, NonNumericPortThrows) {
    EXPECT_THROW(parseUrl("http://example.com:http/api"), std::invalid_argument);
}

TEST(ParseUrl, GarbageStringThrows) {
    EXPECT_THROW(parseUrl("not-a-url"), std::invalid_argument);
}

// ============================================================================
// resolveUrl / appendQuery / percentEncode
// ============================================================================

TEST(ResolveUrl, AbsolutePathReplacesBasePath) {
    EXPECT_EQ(resolveUrl("http://api.example.com:8080/base/", "/api/v1/memories"),
              "http://api.example.com:8080/api/v1/memories");
}

TEST(ResolveUrl, RelativePathAppendsToBaseDirectory) {
    EXPECT_EQ(resolveUrl("http://api.example.com/base/", "v1/keys"),
              "http://api.example.com/base/v1/keys");
    EXPECT_EQ(resolveUrl("http://api.example.com/base", "v1/keys"),
              "http://api.example.com/v1/keys");
}

TEST(ResolveUrl, DefaultPortIsNotRepeated) {
    EXPECT_EQ(resolveUrl("https://api.example.com", "/v1/search/ns/stream"),
              "https://api.example.com/v1/search/ns/stream");
}

TEST(ResolveUrl, AbsoluteUrlWins) {
    EXPECT_EQ(resolveUrl("http://api.example.com/base/", "https://other.example.com/x"),
              "https://other.example.com/x");
}

TEST(ResolveUrl, BaseQueryIsDropped) {
    EXPECT_EQ(resolveUrl("http://api.example.com/base/?token=1", "items"),
              "http://api.example.com/base/items");
}

TEST(AppendQuery, KeepsOrderAndRepeatedKeys) {
    QueryParams params{{"tag", "a"}, {"tag", "b"}, {"limit", "5"}};
    EXPECT_EQ(appendQuery("http://h/p", params), "http://h/p?tag=a&tag=b&limit=5");
}

TEST(AppendQuery, ExtendsExistingQuery) {
    EXPECT_EQ(appendQuery("http://h/p?x=1", {{"y", "2"}}), "http://h/p?x=1&y=2");
}

TEST(AppendQuery, EncodesKeysAndValues) {
    EXPECT_EQ(appendQuery("http://h/p", {{"q s", "a&b=c"}}), "http://h/p?q%20s=a%26b%3Dc");
}

TEST(AppendQuery, EmptyParamsLeaveUrlUntouched) {
    EXPECT_EQ(appendQuery("http://h/p", {}), "http://h/p");
}

TEST(PercentEncode, UnreservedCharactersPassThrough) {
    EXPECT_EQ(percentEncode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST(PercentEncode, ReservedAndNonAsciiAreEncoded) {
    EXPECT_EQ(percentEncode("a/b c"), "a%2Fb%20c");
    EXPECT_EQ(percentEncode("\xC3\xA9"), "%C3%A9");
}

// ============================================================================
// computeBackoffMs
// ============================================================================

TEST(ComputeBackoff, Attempt0InRange200To300) {
    // base=200, jitter in [0,100] => result in [200, 300]
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(0).count();
        EXPECT_GE(ms, 200);
        EXPECT_LE(ms, 300);
    }
}

TEST(ComputeBackoff, Attempt2InRange800To900) {
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(2).count();
        EXPECT_GE(ms, 800);
        EXPECT_LE(ms, 900);
    }
}

TEST(ComputeBackoff, ClampsToMaxPlusJitter) {
    // 200 * 2^10 = 204800, clamped to 5000, + jitter => [5000, 5100]
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(10).count();
        EXPECT_GE(ms, 5000);
        EXPECT_LE(ms, 5100);
    }
}

TEST(ComputeBackoff, HugeAttemptDoesNotOverflow) {
    auto ms = computeBackoffMs(200, 100, 1000).count();
    EXPECT_GE(ms, 1000);
    EXPECT_LE(ms, 1100);
}

TEST(ComputeBackoff, ExponentialGrowth) {
    int64_t prevMin = 0;
    for (int attempt = 0; attempt < 5; ++attempt) {
        int64_t minSeen = std::numeric_limits<int64_t>::max();
        for (int i = 0; i < 20; ++i) {
            minSeen = std::min(minSeen, computeBackoffMs(attempt).count());
        }
        EXPECT_GE(minSeen, prevMin)
            << "Attempt " << attempt << " should not be less than attempt "
            << (attempt - 1);
        prevMin = minSeen;
    }
}

// ============================================================================
// parseHttpDate
// ============================================================================

TEST(ParseHttpDate, ImfFixdate) {
    auto t = parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*t), 784111777);
}

TEST(ParseHttpDate, Rfc850) {
    auto t = parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*t), 784111777);
}

TEST(ParseHttpDate, AsctimeWithSpacePaddedDay) {
    auto t = parseHttpDate("Sun Nov  6 08:49:37 1994");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*t), 784111777);
}

TEST(ParseHttpDate, SurroundingWhitespaceIgnored) {
    auto t = parseHttpDate("  Sun, 06 Nov 1994 08:49:37 GMT  ");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*t), 784111777);
}

TEST(ParseHttpDate, GarbageIsRejected) {
    EXPECT_FALSE(parseHttpDate("").has_value());
    EXPECT_FALSE(parseHttpDate("tomorrow").has_value());
    EXPECT_FALSE(parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT trailing").has_value());
}

// ============================================================================
// Strings and base64
// ============================================================================

TEST(Strings, TrimLowerBlankDigits) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLower("Content-TYPE"), "content-type");
    EXPECT_TRUE(isBlank(" \t\r\n"));
    EXPECT_TRUE(isBlank(""));
    EXPECT_FALSE(isBlank(" x "));
    EXPECT_TRUE(isAllDigits("0123"));
    EXPECT_FALSE(isAllDigits(""));
    EXPECT_FALSE(isAllDigits("-1"));
}

TEST(Base64, EncodesRfc4648Vectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64Encode("hello world"), "aGVsbG8gd29ybGQ=");
}

TEST(Base64, DecodesPaddedAndUnpadded) {
    EXPECT_EQ(base64Decode("Zm9vYg=="), "foob");
    EXPECT_EQ(base64Decode("Zm9vYg"), "foob");
    EXPECT_EQ(base64Decode("aGVsbG8gd29ybGQ="), "hello world");
}

TEST(Base64, DecodesBinaryBytes) {
    const std::string bytes("\x00\xFF\x10\x80", 4);
    EXPECT_EQ(base64Decode(base64Encode(bytes)), bytes);
}

TEST(Base64, InvalidCharacterThrows) {
    EXPECT_THROW(base64Decode("Zm9v!"), std::invalid_argument);
}
