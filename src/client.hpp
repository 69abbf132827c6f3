#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "models.hpp"
#include "ndjson.hpp"
#include "request_builder.hpp"
#include "retry.hpp"
#include "transport.hpp"

#include <memory>
#include <string>
#include <utility>

namespace memclient {

/// Typed HTTP client: builds the request, executes it through the injected
/// transport under the configured retry policy, and returns either the
/// response or exactly one ClientError.
///
/// Holds only read-only configuration; concurrent calls share nothing else.
class Client {
public:
    /// @throws std::invalid_argument for a null transport or an invalid retry policy.
    Client(ClientConfig config,
           std::shared_ptr<Transport> transport,
           RetryScheduler::Sleeper sleeper = nullptr);

    Result<HttpResponse> request(Method method,
                                 const std::string& path,
                                 const RequestOptions& options = {}) const;

    /// Opens a streaming response. Retries cover opening only.
    Result<StreamingBody> requestStream(Method method,
                                        const std::string& path,
                                        const RequestOptions& options = {}) const;

    /// requestStream + NDJSON decoding into records of type T. options.cancel
    /// keeps covering the body after the stream is handed back.
    template <typename T>
    Result<RecordStream<T>> streamRecords(Method method,
                                          const std::string& path,
                                          typename RecordStream<T>::LineParser parser,
                                          const RequestOptions& options = {},
                                          TailPolicy tail = TailPolicy::Salvage) const;

    const ClientConfig& config() const { return mConfig; }
    const HeaderMap&    defaultHeaders() const { return mDefaultHeaders; }

private:
    RetryScheduler schedulerFor(const RequestOptions& options) const;

    ClientConfig            mConfig;
    HeaderMap               mDefaultHeaders;
    TransportExecutor       mExecutor;
    RetryScheduler::Sleeper mSleeper;
};

template <typename T>
Result<RecordStream<T>> Client::streamRecords(Method method,
                                              const std::string& path,
                                              typename RecordStream<T>::LineParser parser,
                                              const RequestOptions& options,
                                              TailPolicy tail) const
{
    auto opened = requestStream(method, path, options);
    if (!opened.ok()) {
        return opened.error();
    }
    StreamingBody body = std::move(opened).value();
    return RecordStream<T>(std::move(body.reader), std::move(parser), tail, body.url, options.cancel);
}

} // namespace memclient
