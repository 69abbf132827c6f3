#pragma once

#include "error_translator.hpp"
#include "models.hpp"
#include "retry.hpp"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace memclient {

/// Absolute http(s) base URL. Throws std::invalid_argument on construction.
class BaseUrl {
public:
    explicit BaseUrl(std::string url);
    const std::string& str() const { return mUrl; }

private:
    std::string mUrl;
};

/// API key. Never printed: operator<< and redacted() emit a placeholder.
class ApiKey {
public:
    /// @throws std::invalid_argument if empty or containing whitespace/control characters.
    explicit ApiKey(std::string key);

    const std::string& reveal() const { return mKey; }
    std::string        redacted() const { return "<redacted>"; }

private:
    std::string mKey;
};

std::ostream& operator<<(std::ostream& os, const ApiKey& key);

/// Memory namespace: 1..64 characters of [A-Za-z0-9_-].
class Namespace {
public:
    explicit Namespace(std::string name);
    const std::string& str() const { return mName; }

private:
    std::string mName;
};

/// Read-only client configuration, injected at construction.
struct ClientConfig {
    BaseUrl                                  baseUrl;
    ApiKey                                   apiKey;
    HeaderMap                                defaultHeaders;
    std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds(30000);
    RetryPolicy                              retry{};
    EmptyMessagePolicy                       emptyMessagePolicy = EmptyMessagePolicy::FallbackToStatus;
    std::string                              userAgent = "memclient/1.0";
    bool                                     verbose   = false;

    ClientConfig(BaseUrl url, ApiKey key)
        : baseUrl(std::move(url))
        , apiKey(std::move(key)) {}
};

/// Copy of @p headers safe to print (Authorization masked).
HeaderMap redactHeaders(const HeaderMap& headers);

} // namespace memclient
