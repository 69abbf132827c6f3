/// @file test_error_translator.cpp
/// Unit tests for ErrorTranslator and Retry-After parsing.

#include "error_translator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <string>

using namespace memclient;
using namespace std::chrono_literals;

namespace {

// Sun, 06 Nov 1994 08:49:37 GMT
const std::chrono::system_clock::time_point kNow =
    std::chrono::system_clock::from_time_t(784111777);

ErrorTranslator fixedClockTranslator(EmptyMessagePolicy policy = EmptyMessagePolicy::FallbackToStatus) {
    return ErrorTranslator(policy, [] { return kNow; });
}

} // namespace

// ============================================================================
// parseRetryAfter
// ============================================================================

TEST(ParseRetryAfter, DeltaSecondsBecomeMilliseconds) {
    auto delay = parseRetryAfter("120", kNow);
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(*delay, 120000ms);
}

TEST(ParseRetryAfter, ZeroIsAllowed) {
    auto delay = parseRetryAfter("0", kNow);
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(*delay, 0ms);
}

TEST(ParseRetryAfter, WhitespaceAroundValueIsIgnored) {
    auto delay = parseRetryAfter("  5 ", kNow);
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(*delay, 5000ms);
}

TEST(ParseRetryAfter, HttpDateIsRelativeToNow) {
    auto delay = parseRetryAfter("Sun, 06 Nov 1994 08:50:07 GMT", kNow);
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(*delay, 30000ms);
}

TEST(ParseRetryAfter, PastHttpDateClampsToZero) {
    auto delay = parseRetryAfter("Sun, 06 Nov 1994 08:00:00 GMT", kNow);
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(*delay, 0ms);
}

TEST(ParseRetryAfter, UnusableValuesYieldNothing) {
    EXPECT_FALSE(parseRetryAfter("", kNow).has_value());
    EXPECT_FALSE(parseRetryAfter("soon", kNow).has_value());
    EXPECT_FALSE(parseRetryAfter("-5", kNow).has_value());
    EXPECT_FALSE(parseRetryAfter("1.5", kNow).has_value());
}

TEST(ParseRetryAfter, OverflowingSecondsYieldNothing) {
    EXPECT_FALSE(parseRetryAfter("99999999999999999999999", kNow).has_value());
    const auto huge = std::to_string(std::numeric_limits<int64_t>::max() / 1000 + 1);
    EXPECT_FALSE(parseRetryAfter(huge, kNow).has_value());
}

// ============================================================================
// translate: authorization
// ============================================================================

TEST(ErrorTranslator, Status401BecomesAuthorizationError) {
    auto error = fixedClockTranslator().translate(401, "Unauthorized", {}, nullptr,
                                                  "http://h/api/v1/memories");
    const auto* auth = std::get_if<AuthorizationError>(&error);
    ASSERT_NE(auth, nullptr);
    EXPECT_EQ(auth->reason, "Unauthorized: Unauthorized");
    EXPECT_EQ(auth->url, "http://h/api/v1/memories");
    EXPECT_EQ(auth->status, 401u);
}

TEST(ErrorTranslator, Status403WithEmptyTextFallsBackToReasonPhrase) {
    auto error = fixedClockTranslator().translate(403, "", {}, nullptr, "http://h/x");
    const auto* auth = std::get_if<AuthorizationError>(&error);
    ASSERT_NE(auth, nullptr);
    EXPECT_EQ(auth->reason, "Unauthorized: Forbidden");
    EXPECT_EQ(auth->status, 403u);
}

TEST(ErrorTranslator, VerbatimPolicyKeepsEmptyText) {
    auto error = fixedClockTranslator(EmptyMessagePolicy::Verbatim)
                     .translate(403, "", {}, nullptr, "http://h/x");
    const auto* auth = std::get_if<AuthorizationError>(&error);
    ASSERT_NE(auth, nullptr);
    EXPECT_EQ(auth->reason, "Unauthorized: ");
}

// ============================================================================
// translate: rate limiting
// ============================================================================

TEST(ErrorTranslator, Status429CarriesRetryAfter) {
    HeaderMap headers{{"retry-after", "3"}};
    auto error = fixedClockTranslator().translate(429, "Too Many Requests", headers,
                                                  nullptr, "http://h/x");
    const auto* limited = std::get_if<RateLimitError>(&error);
    ASSERT_NE(limited, nullptr);
    ASSERT_TRUE(limited->retryAfter.has_value());
    EXPECT_EQ(*limited->retryAfter, 3000ms);
    EXPECT_EQ(limited->url, "http://h/x");
}

TEST(ErrorTranslator, Status429WithoutHeaderHasNoHint) {
    auto error = fixedClockTranslator().translate(429, "", {}, nullptr, "http://h/x");
    const auto* limited = std::get_if<RateLimitError>(&error);
    ASSERT_NE(limited, nullptr);
    EXPECT_FALSE(limited->retryAfter.has_value());
}

TEST(ErrorTranslator, Status429WithGarbageHeaderHasNoHint) {
    HeaderMap headers{{"Retry-After", "later"}};
    auto error = fixedClockTranslator().translate(429, "", headers, nullptr, "http://h/x");
    const auto* limited = std::get_if<RateLimitError>(&error);
    ASSERT_NE(limited, nullptr);
    EXPECT_FALSE(limited->retryAfter.has_value());
}

TEST(ErrorTranslator, Status429WithHttpDateUsesInjectedClock) {
    HeaderMap headers{{"Retry-After", "Sun, 06 Nov 1994 08:49:47 GMT"}};
    auto error = fixedClockTranslator().translate(429, "", headers, nullptr, "http://h/x");
    const auto* limited = std::get_if<RateLimitError>(&error);
    ASSERT_NE(limited, nullptr);
    ASSERT_TRUE(limited->retryAfter.has_value());
    EXPECT_EQ(*limited->retryAfter, 10000ms);
}

// ============================================================================
// translate: everything else
// ============================================================================

TEST(ErrorTranslator, ServerErrorBecomesHttpErrorWithBody) {
    nlohmann::json body = {{"error", "boom"}};
    auto error = fixedClockTranslator().translate(500, "Internal Server Error", {}, body,
                                                  "http://h/x");
    const auto* http = std::get_if<HttpError>(&error);
    ASSERT_NE(http, nullptr);
    EXPECT_EQ(http->status, 500u);
    EXPECT_EQ(http->message, "Internal Server Error");
    EXPECT_EQ(http->url, "http://h/x");
    EXPECT_EQ(http->body, body);
}

TEST(ErrorTranslator, NotFoundWithEmptyTextUsesReasonPhrase) {
    auto error = fixedClockTranslator().translate(404, "", {}, nullptr, "http://h/x");
    const auto* http = std::get_if<HttpError>(&error);
    ASSERT_NE(http, nullptr);
    EXPECT_EQ(http->message, "Not Found");
    EXPECT_TRUE(http->body.is_null());
}

TEST(ErrorTranslator, UnknownStatusFallsBackToCode) {
    auto error = fixedClockTranslator().translate(599, "", {}, nullptr, "http://h/x");
    const auto* http = std::get_if<HttpError>(&error);
    ASSERT_NE(http, nullptr);
    EXPECT_EQ(http->message, "HTTP 599");
}

TEST(ErrorTranslator, ServerProvidedTextWins) {
    auto error = fixedClockTranslator().translate(502, "Upstream Sad", {}, nullptr, "http://h/x");
    EXPECT_EQ(std::get<HttpError>(error).message, "Upstream Sad");
}

// ============================================================================
// Classification helpers
// ============================================================================

TEST(Classification, DefaultRetryability) {
    EXPECT_TRUE(isRetryable(NetworkError{"reset", "u"}));
    EXPECT_TRUE(isRetryable(HttpError{503, "Unavailable", "u", nullptr}));
    EXPECT_TRUE(isRetryable(RateLimitError{std::nullopt, "u"}));
    EXPECT_FALSE(isRetryable(AuthorizationError{"Unauthorized: x", "u", 401}));
    EXPECT_FALSE(isRetryable(RequestError{"bad", std::nullopt}));
}

TEST(Classification, TransientServerErrorsOnly) {
    EXPECT_TRUE(isTransientServerError(HttpError{503, "", "u", nullptr}));
    EXPECT_FALSE(isTransientServerError(HttpError{404, "", "u", nullptr}));
    EXPECT_TRUE(isTransientServerError(NetworkError{"reset", "u"}));
    EXPECT_FALSE(isTransientServerError(AuthorizationError{"", "u", 403}));
}

TEST(Classification, TagsAndUrls) {
    ClientError net = NetworkError{"refused", "http://h/a"};
    EXPECT_STREQ(errorTag(net), "NetworkError");
    EXPECT_EQ(errorUrl(net), std::optional<std::string>("http://h/a"));

    ClientError req = RequestError{"bad key", std::string("too long")};
    EXPECT_STREQ(errorTag(req), "RequestError");
    EXPECT_FALSE(errorUrl(req).has_value());
    EXPECT_EQ(describe(req), "RequestError: bad key [too long]");
}
