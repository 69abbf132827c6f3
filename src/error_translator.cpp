#include "error_translator.hpp"
#include "util.hpp"

#include <boost/beast/http/status.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace memclient {

namespace http = boost::beast::http;

std::optional<std::chrono::milliseconds>
parseRetryAfter(const std::string& value, std::chrono::system_clock::time_point now)
{
    const std::string text = trim(value);
    if (text.empty()) {
        return std::nullopt;
    }

    // delta-seconds
    if (isAllDigits(text)) {
        int64_t seconds = 0;
        const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
        if (ec != std::errc() || end != text.data() + text.size()) {
            return std::nullopt;   // out of range
        }
        if (seconds > std::numeric_limits<int64_t>::max() / 1000) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(seconds * 1000);
    }

    // HTTP-date; "-5" and other signed numbers fall through to here and fail.
    const auto target = parseHttpDate(text);
    if (!target) {
        return std::nullopt;
    }
    const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(*target - now);
    return std::max(delta, std::chrono::milliseconds(0));
}

ErrorTranslator::ErrorTranslator(EmptyMessagePolicy policy, Clock clock)
    : mPolicy(policy)
    , mClock(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })) {}

ClientError ErrorTranslator::translate(unsigned int status,
                                       const std::string& statusText,
                                       const HeaderMap& headers,
                                       const nlohmann::json& body,
                                       const std::string& url) const
{
    if (status == 401 || status == 403) {
        return AuthorizationError{"Unauthorized: " + messageFor(status, statusText), url, status};
    }

    if (status == 429) {
        return RateLimitError{retryAfter(headers), url};
    }

    return HttpError{status, messageFor(status, statusText), url, body};
}

std::optional<std::chrono::milliseconds>
ErrorTranslator::retryAfter(const HeaderMap& headers) const {
    auto it = headers.find("Retry-After");
    if (it == headers.end()) {
        return std::nullopt;
    }
    return parseRetryAfter(it->second, mClock());
}

std::string ErrorTranslator::messageFor(unsigned int status,
                                        const std::string& statusText) const
{
    if (!statusText.empty() || mPolicy == EmptyMessagePolicy::Verbatim) {
        return statusText;
    }

    const auto reason = http::obsolete_reason(http::int_to_status(status));
    if (!reason.empty() && reason != "<unknown-status>") {
        return std::string(reason.data(), reason.size());
    }
    return "HTTP " + std::to_string(status);
}

} // namespace memclient
