#include "retry.hpp"
#include "util.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace memclient {

RetryScheduler::RetryScheduler(RetryPolicy policy, Sleeper sleeper)
    : mPolicy(std::move(policy))
    , mSleep(std::move(sleeper))
{
    if (mPolicy.attempts < 1) {
        throw std::invalid_argument("RetryPolicy.attempts must be >= 1");
    }
    if (mPolicy.delay.count() < 0) {
        throw std::invalid_argument("RetryPolicy.delay must not be negative");
    }
}

void RetryScheduler::pause(std::chrono::milliseconds delay) const {
    if (mSleep) {
        mSleep(delay);
        return;
    }
    if (!mCancel) {
        std::this_thread::sleep_for(delay);
        return;
    }

    std::mutex              mutex;
    std::condition_variable woken;
    bool                    stop = false;
    auto registration = mCancel->onCancel([&] {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stop = true;
        }
        woken.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex);
    woken.wait_for(lock, delay, [&] { return stop; });
    // lock is released before registration unregisters.
}

std::chrono::milliseconds RetryScheduler::delayFor(int attempt, const ClientError& error) const {
    if (const auto* limited = std::get_if<RateLimitError>(&error)) {
        if (limited->retryAfter) {
            return *limited->retryAfter;
        }
    }

    if (mPolicy.backoff == Backoff::Exponential) {
        return computeBackoffMs(attempt, mPolicy.delay.count(), mPolicy.maxDelay.count());
    }
    return mPolicy.delay;
}

} // namespace memclient
