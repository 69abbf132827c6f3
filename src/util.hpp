#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace memclient {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path plus query (e.g. "/v1/keys?limit=5")
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Resolve @p path against @p base the way a browser resolves a link:
/// absolute URLs win, "/x" replaces the base path, "x" is relative to the
/// base directory. Query and fragment of the base are dropped.
std::string resolveUrl(const std::string& base, const std::string& path);

/// Append query parameters in the given order. Repeated keys are kept.
std::string appendQuery(const std::string& url, const QueryParams& params);

/// RFC 3986 percent-encoding; unreserved characters pass through.
std::string percentEncode(std::string_view text);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// Parse an RFC 7231 HTTP-date (IMF-fixdate, RFC 850 or asctime form).
std::optional<std::chrono::system_clock::time_point>
parseHttpDate(const std::string& value);

std::string trim(std::string_view text);
std::string toLower(std::string_view text);
bool        isBlank(std::string_view text);
bool        isAllDigits(std::string_view text);

std::string base64Encode(std::string_view bytes);

/// Throws std::invalid_argument on characters outside the base64 alphabet.
std::string base64Decode(std::string_view text);

} // namespace memclient
