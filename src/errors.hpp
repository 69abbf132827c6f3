#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace memclient {

// ---------------------------------------------------------------------------
// Error variants. Every variant tied to a remote call carries its URL.
// ---------------------------------------------------------------------------

/// Transport-level failure: DNS, refused connection, timeout or abort.
struct NetworkError {
    std::string cause;
    std::string url;
};

/// Non-2xx response not otherwise classified.
struct HttpError {
    unsigned int   status = 0;
    std::string    message;
    std::string    url;
    nlohmann::json body;   // null when the response carried no decodable body
};

/// 401 / 403.
struct AuthorizationError {
    std::string  reason;
    std::string  url;
    unsigned int status = 0;
};

/// 429, with the server's Retry-After hint when one was usable.
struct RateLimitError {
    std::optional<std::chrono::milliseconds> retryAfter;
    std::string                              url;
};

/// Local failure while building or serializing a request.
struct RequestError {
    std::string                cause;
    std::optional<std::string> details;
};

using ClientError = std::variant<NetworkError,
                                 HttpError,
                                 AuthorizationError,
                                 RateLimitError,
                                 RequestError>;

/// Variant name, e.g. "RateLimitError".
const char* errorTag(const ClientError& error);

/// One-line human-readable summary (never contains credentials).
std::string describe(const ClientError& error);

/// URL of the failed call, when the variant has one.
std::optional<std::string> errorUrl(const ClientError& error);

/// Default retry classification: Network, Http and RateLimit errors are
/// transient; Authorization and Request errors are terminal.
bool isRetryable(const ClientError& error);

/// Narrower classifier: network failures, 429 and 5xx only.
bool isTransientServerError(const ClientError& error);

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ---------------------------------------------------------------------------
// Result<T, E>: a value or one typed error, never both.
// ---------------------------------------------------------------------------

template <typename T, typename E = ClientError>
class Result {
public:
    Result(T value) : mData(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : mData(std::in_place_index<1>, std::move(error)) {}

    /// Accepts a single error variant (e.g. NetworkError) for E = ClientError.
    template <typename V,
              typename = std::enable_if_t<
                  !std::is_same_v<std::decay_t<V>, Result> &&
                  !std::is_same_v<std::decay_t<V>, T> &&
                  !std::is_same_v<std::decay_t<V>, E> &&
                  std::is_constructible_v<E, V&&> &&
                  !std::is_constructible_v<T, V&&>>>
    Result(V&& error) : mData(std::in_place_index<1>, E(std::forward<V>(error))) {}

    bool ok() const { return mData.index() == 0; }
    explicit operator bool() const { return ok(); }

    T&       value() &       { return std::get<0>(mData); }
    const T& value() const & { return std::get<0>(mData); }
    T&&      value() &&      { return std::get<0>(std::move(mData)); }

    T*       operator->()       { return &value(); }
    const T* operator->() const { return &value(); }
    T&       operator*()        { return value(); }
    const T& operator*() const  { return value(); }

    E&       error()       { return std::get<1>(mData); }
    const E& error() const { return std::get<1>(mData); }

private:
    std::variant<T, E> mData;
};

template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : mError(std::move(error)) {}

    template <typename V,
              typename = std::enable_if_t<
                  !std::is_same_v<std::decay_t<V>, Result> &&
                  !std::is_same_v<std::decay_t<V>, E> &&
                  std::is_constructible_v<E, V&&>>>
    Result(V&& error) : mError(E(std::forward<V>(error))) {}

    bool ok() const { return !mError.has_value(); }
    explicit operator bool() const { return ok(); }

    E&       error()       { return *mError; }
    const E& error() const { return *mError; }

private:
    std::optional<E> mError;
};

} // namespace memclient
