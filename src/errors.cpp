#include "errors.hpp"

namespace memclient {

const char* errorTag(const ClientError& error) {
    return std::visit(overloaded{
        [](const NetworkError&)       { return "NetworkError"; },
        [](const HttpError&)          { return "HttpError"; },
        [](const AuthorizationError&) { return "AuthorizationError"; },
        [](const RateLimitError&)     { return "RateLimitError"; },
        [](const RequestError&)       { return "RequestError"; },
    }, error);
}

std::string describe(const ClientError& error) {
    return std::visit(overloaded{
        [](const NetworkError& e) {
            return "NetworkError: " + e.cause + " (" + e.url + ")";
        },
        [](const HttpError& e) {
            return "HttpError " + std::to_string(e.status) + ": " + e.message
                 + " (" + e.url + ")";
        },
        [](const AuthorizationError& e) {
            return "AuthorizationError: " + e.reason + " (" + e.url + ")";
        },
        [](const RateLimitError& e) {
            std::string out = "RateLimitError";
            if (e.retryAfter) {
                out += ": retry after " + std::to_string(e.retryAfter->count()) + " ms";
            }
            return out + " (" + e.url + ")";
        },
        [](const RequestError& e) {
            std::string out = "RequestError: " + e.cause;
            if (e.details) out += " [" + *e.details + "]";
            return out;
        },
    }, error);
}

std::optional<std::string> errorUrl(const ClientError& error) {
    return std::visit(overloaded{
        [](const NetworkError& e)       -> std::optional<std::string> { return e.url; },
        [](const HttpError& e)          -> std::optional<std::string> { return e.url; },
        [](const AuthorizationError& e) -> std::optional<std::string> { return e.url; },
        [](const RateLimitError& e)     -> std::optional<std::string> { return e.url; },
        [](const RequestError&)         -> std::optional<std::string> { return std::nullopt; },
    }, error);
}

bool isRetryable(const ClientError& error) {
    return std::visit(overloaded{
        [](const NetworkError&)       { return true; },
        [](const HttpError&)          { return true; },
        [](const RateLimitError&)     { return true; },
        [](const AuthorizationError&) { return false; },
        [](const RequestError&)       { return false; },
    }, error);
}

bool isTransientServerError(const ClientError& error) {
    if (const auto* http = std::get_if<HttpError>(&error)) {
        return http->status >= 500 && http->status <= 599;
    }
    return isRetryable(error);
}

} // namespace memclient
