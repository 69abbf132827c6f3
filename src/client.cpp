#include "client.hpp"

#include <iostream>
#include <stdexcept>

namespace memclient {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Client::Client(ClientConfig config,
               std::shared_ptr<Transport> transport,
               RetryScheduler::Sleeper sleeper)
    : mConfig(std::move(config))
    , mExecutor(std::move(transport),
                ErrorTranslator(mConfig.emptyMessagePolicy),
                mConfig.timeout)
    , mSleeper(std::move(sleeper))
{
    RetryScheduler validate(mConfig.retry);   // throws std::invalid_argument

    mDefaultHeaders = mConfig.defaultHeaders;
    mDefaultHeaders.emplace("Accept", "application/json");
    mDefaultHeaders.emplace("User-Agent", mConfig.userAgent);
    mDefaultHeaders["Authorization"] = "Bearer " + mConfig.apiKey.reveal();

    mExecutor.setVerbose(mConfig.verbose);
}

RetryScheduler Client::schedulerFor(const RequestOptions& options) const {
    RetryPolicy policy = mConfig.retry;
    if (options.retryIf) {
        policy.classifier = options.retryIf;
    }

    RetryScheduler scheduler(std::move(policy), mSleeper);
    scheduler.setCancellation(options.cancel);
    scheduler.setVerbose(mConfig.verbose);
    return scheduler;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<HttpResponse> Client::request(Method method,
                                     const std::string& path,
                                     const RequestOptions& options) const
{
    auto built = buildRequest(mConfig.baseUrl.str(), method, path, options, mDefaultHeaders);
    if (!built.ok()) {
        return built.error();
    }
    const HttpRequest& request = built.value();

    auto scheduler = schedulerFor(options);
    auto result = scheduler.run([&] { return mExecutor.execute(request, options.cancel); });

    if (mConfig.verbose && !result.ok()) {
        std::cerr << "[Client] " << toString(method) << " " << path << " failed: "
                  << describe(result.error()) << "\n";
    }
    return result;
}

Result<StreamingBody> Client::requestStream(Method method,
                                            const std::string& path,
                                            const RequestOptions& options) const
{
    auto built = buildRequest(mConfig.baseUrl.str(), method, path, options, mDefaultHeaders);
    if (!built.ok()) {
        return built.error();
    }
    const HttpRequest& request = built.value();

    auto scheduler = schedulerFor(options);
    auto result = scheduler.run([&] { return mExecutor.openStream(request, options.cancel); });

    if (mConfig.verbose && !result.ok()) {
        std::cerr << "[Client] " << toString(method) << " " << path << " (stream) failed: "
                  << describe(result.error()) << "\n";
    }
    return result;
}

} // namespace memclient
