#pragma once

#include "cancellation.hpp"
#include "errors.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <utility>

namespace memclient {

enum class Backoff { Fixed, Exponential };

struct RetryPolicy {
    int                       attempts = 1;                       // total tries, >= 1
    std::chrono::milliseconds delay{0};                           // fixed / base delay
    Backoff                   backoff  = Backoff::Fixed;
    std::chrono::milliseconds maxDelay{5000};                     // exponential cap
    std::function<bool(const ClientError&)> classifier = isRetryable;
};

/// Runs an operation returning Result<...> up to policy.attempts times.
///
/// Terminal errors come back immediately and unchanged; after the last
/// attempt the last observed error is returned as-is. A RateLimitError with
/// a Retry-After hint replaces the configured delay before the next try.
/// With a cancellation token the wait ends early on cancel() and no further
/// attempt is made; the last observed error is returned.
class RetryScheduler {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    struct Stats {
        int                       attempts = 0;
        int                       retries  = 0;
        std::chrono::milliseconds totalDelay{0};
    };

    /// @throws std::invalid_argument if policy.attempts < 1.
    explicit RetryScheduler(RetryPolicy policy, Sleeper sleeper = nullptr);

    template <typename Op>
    auto run(Op&& op) -> decltype(op());

    /// Delay before the next attempt after @p error on 0-based @p attempt.
    std::chrono::milliseconds delayFor(int attempt, const ClientError& error) const;

    Stats stats() const { return mStats; }
    void  setVerbose(bool v) { mVerbose = v; }
    void  setCancellation(std::optional<CancellationToken> cancel) { mCancel = std::move(cancel); }

private:
    bool cancelled() const { return mCancel && mCancel->cancelled(); }
    void pause(std::chrono::milliseconds delay) const;

    RetryPolicy                      mPolicy;
    Sleeper                          mSleep;
    std::optional<CancellationToken> mCancel;
    Stats                            mStats{};
    bool                             mVerbose = false;
};

template <typename Op>
auto RetryScheduler::run(Op&& op) -> decltype(op()) {
    for (int attempt = 1;; ++attempt) {
        ++mStats.attempts;
        auto result = op();
        if (result.ok()) {
            return result;
        }

        const ClientError& error = result.error();
        const bool retryable = mPolicy.classifier ? mPolicy.classifier(error) : false;

        if (!retryable || attempt >= mPolicy.attempts || cancelled()) {
            if (mVerbose && retryable) {
                std::cerr << "[Retry] Giving up after " << attempt << " attempt(s): "
                          << describe(error) << "\n";
            }
            return result;
        }

        const auto delay = delayFor(attempt - 1, error);
        ++mStats.retries;
        mStats.totalDelay += delay;

        if (mVerbose) {
            std::cerr << "[Retry] " << errorTag(error) << " - attempt " << attempt
                      << "/" << mPolicy.attempts << ", waiting "
                      << delay.count() << " ms\n";
        }

        pause(delay);
        if (cancelled()) {
            if (mVerbose) {
                std::cerr << "[Retry] Cancelled while waiting, giving up\n";
            }
            return result;
        }
    }
}

} // namespace memclient
