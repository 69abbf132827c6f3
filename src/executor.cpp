#include "executor.hpp"
#include "config.hpp"
#include "util.hpp"

#include <iostream>
#include <utility>

namespace memclient {

namespace {

constexpr const char* kAbortedCause          = "Request timed out or aborted";
constexpr const char* kUnknownTransportCause = "Unknown transport error";
constexpr std::size_t kMaxErrorBodyBytes     = 64 * 1024;

/// Stream with no body at all (e.g. 204 on a streaming endpoint).
class EmptyReader : public ByteReader {
public:
    std::optional<std::string> read() override { return std::nullopt; }
    void cancel() override {}
};

std::string contentTypeOf(const HeaderMap& headers) {
    auto it = headers.find("Content-Type");
    return it != headers.end() ? it->second : std::string();
}

/// Read an error body in full (bounded). Stream errors are reported to the caller.
std::string readErrorBody(ByteReader& reader) {
    std::string out;
    while (auto chunk = reader.read()) {
        out += *chunk;
        if (out.size() >= kMaxErrorBodyBytes) {
            reader.cancel();
            break;
        }
    }
    return out;
}

void logRequest(const HttpRequest& request) {
    std::cerr << "[Executor] " << toString(request.method) << " " << request.url << "\n";
    for (const auto& [name, value] : redactHeaders(request.headers)) {
        std::cerr << "[Executor]   " << name << ": " << value << "\n";
    }
    if (request.body) {
        if (request.body->size() <= 300) {
            std::cerr << "[Executor] Body: " << *request.body << "\n";
        } else {
            std::cerr << "[Executor] Body: " << request.body->substr(0, 300)
                      << " ...(truncated)\n";
        }
    }
}

} // namespace

nlohmann::json decodeBody(const std::string& contentType, const std::string& text) {
    const std::string type = toLower(contentType);

    if (type.find("application/x-ndjson") != std::string::npos ||
        type.find("text/") != std::string::npos) {
        return text;
    }

    if (type.find("application/json") != std::string::npos) {
        auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (parsed.is_discarded()) {
            return nullptr;
        }
        return parsed;
    }

    return nullptr;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TransportExecutor::TransportExecutor(std::shared_ptr<Transport> transport,
                                     ErrorTranslator translator,
                                     std::optional<std::chrono::milliseconds> defaultTimeout)
    : mTransport(std::move(transport))
    , mTimers(std::make_shared<TimerService>())
    , mTranslator(std::move(translator))
    , mDefaultTimeout(defaultTimeout)
{
    if (!mTransport) {
        throw std::invalid_argument("TransportExecutor requires a transport");
    }
}

std::optional<std::chrono::milliseconds>
TransportExecutor::timeoutFor(const HttpRequest& request) const {
    return request.timeout ? request.timeout : mDefaultTimeout;
}

// ---------------------------------------------------------------------------
// Single round trip
// ---------------------------------------------------------------------------

Result<HttpResponse>
TransportExecutor::execute(const HttpRequest& request,
                           const std::optional<CancellationToken>& callerCancel) const
{
    CancellationToken token;
    CancellationToken::Registration link;
    if (callerCancel) {
        link = callerCancel->onCancel([token]() mutable { token.cancel(); });
    }

    if (mVerbose) {
        logRequest(request);
    }

    RawResponse raw;
    {
        std::optional<DeadlineTimer> deadline;
        if (const auto timeout = timeoutFor(request)) {
            deadline.emplace(*mTimers, token, *timeout);
        }

        try {
            raw = mTransport->send(request, token);
        } catch (const TransportAborted&) {
            return NetworkError{kAbortedCause, request.url};
        } catch (const std::exception& e) {
            if (token.cancelled()) {
                return NetworkError{kAbortedCause, request.url};
            }
            return NetworkError{e.what(), request.url};
        } catch (...) {
            return NetworkError{token.cancelled() ? kAbortedCause : kUnknownTransportCause,
                                request.url};
        }
    }

    HttpResponse response;
    response.status  = raw.status;
    response.headers = std::move(raw.headers);
    response.body    = decodeBody(contentTypeOf(response.headers), raw.body);

    if (mVerbose) {
        std::cerr << "[Executor] HTTP " << raw.status << " " << request.url << "\n";
    }

    if (raw.status >= 400) {
        return mTranslator.translate(raw.status, raw.statusText, response.headers,
                                     response.body, request.url);
    }
    return response;
}

// ---------------------------------------------------------------------------
// Streaming round trip
// ---------------------------------------------------------------------------

Result<StreamingBody>
TransportExecutor::openStream(const HttpRequest& request,
                              const std::optional<CancellationToken>& callerCancel) const
{
    CancellationToken token;
    CancellationToken::Registration link;
    if (callerCancel) {
        link = callerCancel->onCancel([token]() mutable { token.cancel(); });
    }

    if (mVerbose) {
        logRequest(request);
    }

    std::optional<DeadlineTimer> deadline;
    if (const auto timeout = timeoutFor(request)) {
        deadline.emplace(*mTimers, token, *timeout);
    }

    StreamResponse raw;
    try {
        raw = mTransport->openStream(request, token);
    } catch (const TransportAborted&) {
        return NetworkError{kAbortedCause, request.url};
    } catch (const std::exception& e) {
        if (token.cancelled()) {
            return NetworkError{kAbortedCause, request.url};
        }
        return NetworkError{e.what(), request.url};
    } catch (...) {
        return NetworkError{token.cancelled() ? kAbortedCause : kUnknownTransportCause,
                            request.url};
    }

    if (!raw.reader) {
        raw.reader = std::make_unique<EmptyReader>();
    }

    if (mVerbose) {
        std::cerr << "[Executor] HTTP " << raw.status << " (stream) " << request.url << "\n";
    }

    if (raw.status >= 400) {
        nlohmann::json body;
        {
            ByteReader* reader = raw.reader.get();
            auto abortRead = token.onCancel([reader] { reader->cancel(); });
            try {
                body = decodeBody(contentTypeOf(raw.headers), readErrorBody(*reader));
            } catch (const std::exception& e) {
                // The status is the real failure; an unreadable body must not mask it.
                if (mVerbose) {
                    std::cerr << "[Executor] Could not read error body: " << e.what() << "\n";
                }
            }
        }
        return mTranslator.translate(raw.status, raw.statusText, raw.headers, body, request.url);
    }

    deadline.reset();

    StreamingBody stream;
    stream.status  = raw.status;
    stream.headers = std::move(raw.headers);
    stream.url     = request.url;
    stream.reader  = std::move(raw.reader);
    return std::move(stream);
}

} // namespace memclient
