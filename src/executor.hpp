#pragma once

#include "cancellation.hpp"
#include "error_translator.hpp"
#include "errors.hpp"
#include "models.hpp"
#include "transport.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace memclient {

/// Successfully opened streaming response.
struct StreamingBody {
    unsigned int                status = 0;
    HeaderMap                   headers;
    std::string                 url;
    std::unique_ptr<ByteReader> reader;
};

/// Decode a response body by its Content-Type: JSON -> value,
/// text/* and NDJSON -> raw string, anything else (or bad JSON) -> null.
nlohmann::json decodeBody(const std::string& contentType, const std::string& text);

/// Runs one round trip through the injected transport, arming a deadline
/// when a timeout applies, and turns every outcome into a Result.
/// Deadlines of every call share one timer thread owned by the executor.
class TransportExecutor {
public:
    TransportExecutor(std::shared_ptr<Transport> transport,
                      ErrorTranslator translator = ErrorTranslator(),
                      std::optional<std::chrono::milliseconds> defaultTimeout = std::nullopt);

    Result<HttpResponse>  execute(const HttpRequest& request,
                                  const std::optional<CancellationToken>& callerCancel = std::nullopt) const;

    /// Timeout covers connection and response headers, not the body stream.
    Result<StreamingBody> openStream(const HttpRequest& request,
                                     const std::optional<CancellationToken>& callerCancel = std::nullopt) const;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::optional<std::chrono::milliseconds> timeoutFor(const HttpRequest& request) const;

    std::shared_ptr<Transport>               mTransport;
    std::shared_ptr<TimerService>            mTimers;
    ErrorTranslator                          mTranslator;
    std::optional<std::chrono::milliseconds> mDefaultTimeout;
    bool                                     mVerbose = false;
};

} // namespace memclient
