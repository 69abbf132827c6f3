#pragma once

#include "errors.hpp"
#include "models.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace memclient {

/// What to report when a response carries an empty status text.
enum class EmptyMessagePolicy {
    FallbackToStatus,   // standard reason phrase, or "HTTP <status>"
    Verbatim,           // keep the empty string
};

/// Interpret a Retry-After value (delta-seconds or HTTP-date) relative to @p now.
/// Returns std::nullopt for empty, negative or unparseable values.
std::optional<std::chrono::milliseconds>
parseRetryAfter(const std::string& value, std::chrono::system_clock::time_point now);

/// Classifies a non-2xx response into exactly one ClientError variant.
/// Deterministic: the clock is injected.
class ErrorTranslator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ErrorTranslator(EmptyMessagePolicy policy = EmptyMessagePolicy::FallbackToStatus,
                             Clock clock = nullptr);

    ClientError translate(unsigned int status,
                          const std::string& statusText,
                          const HeaderMap& headers,
                          const nlohmann::json& body,
                          const std::string& url) const;

    std::optional<std::chrono::milliseconds> retryAfter(const HeaderMap& headers) const;

    EmptyMessagePolicy emptyMessagePolicy() const { return mPolicy; }

private:
    std::string messageFor(unsigned int status, const std::string& statusText) const;

    EmptyMessagePolicy mPolicy;
    Clock              mClock;
};

} // namespace memclient
