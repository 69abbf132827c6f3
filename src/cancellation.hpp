#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/steady_timer.hpp>

namespace memclient {

/// Shared cancellation flag with callbacks. Copies refer to the same state.
///
/// Callbacks run on the thread that calls cancel(), under the token's lock:
/// a callback must not touch the token it is registered on.
class CancellationToken {
    struct State;

public:
    /// Unregisters its callback on destruction. Once reset() returns the
    /// callback is neither running nor will it run.
    class Registration {
    public:
        Registration() = default;
        ~Registration();
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        void reset();

    private:
        friend class CancellationToken;
        Registration(std::shared_ptr<State> state, std::uint64_t id);

        std::weak_ptr<State> mState;
        std::uint64_t        mId = 0;
    };

    CancellationToken();

    /// Idempotent. Runs every registered callback once.
    void cancel();
    bool cancelled() const;

    /// Runs @p callback immediately if already cancelled.
    Registration onCancel(std::function<void()> callback) const;

private:
    struct State {
        std::mutex                                        mutex;
        bool                                              cancelled = false;
        std::uint64_t                                     nextId    = 1;
        std::map<std::uint64_t, std::function<void()>>    callbacks;
    };

    std::shared_ptr<State> mState;
};

/// One io_context thread that drives every DeadlineTimer armed on it.
/// Must outlive those timers; the destructor joins once pending waits drain.
class TimerService {
public:
    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    boost::asio::io_context& context() { return mIoc; }

private:
    boost::asio::io_context                                                  mIoc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> mWork;
    std::thread                                                              mThread;
};

/// Cancels a token once a deadline passes. Destruction disarms the timer
/// synchronously: after ~DeadlineTimer() returns the token is never cancelled
/// by it.
class DeadlineTimer {
public:
    DeadlineTimer(TimerService& service, CancellationToken token, std::chrono::milliseconds timeout);
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    bool fired() const { return mState->fired.load(); }

private:
    // Touched only on the service thread, except for fired.
    struct State {
        explicit State(boost::asio::io_context& ioc) : timer(ioc) {}

        boost::asio::steady_timer timer;
        std::atomic<bool>         fired{false};
        bool                      disarmed = false;
    };

    boost::asio::io_context& mIoc;
    std::shared_ptr<State>   mState;
};

} // namespace memclient
