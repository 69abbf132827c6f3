#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "util.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace memclient {

/// Absent, raw string (sent unchanged) or structured value (serialized to JSON).
using RequestBody = std::variant<std::monostate, std::string, nlohmann::json>;

/// Per-call inputs to Client::request / Client::requestStream.
struct RequestOptions {
    RequestBody                              body;
    HeaderMap                                headers;       // override client defaults
    QueryParams                              queryParams;   // appended in order
    std::optional<std::chrono::milliseconds> timeout;       // overrides client timeout
    std::optional<CancellationToken>         cancel;

    /// Replaces the retry policy's classifier for this call only.
    std::function<bool(const ClientError&)>  retryIf;
};

/// Assemble the final request: URL resolved against @p baseUrl with the
/// query appended, default headers merged under per-call ones, body
/// serialized. Fails with RequestError, never throws.
Result<HttpRequest> buildRequest(const std::string& baseUrl,
                                 Method method,
                                 const std::string& path,
                                 const RequestOptions& options,
                                 const HeaderMap& defaultHeaders = {});

} // namespace memclient
