#include "cancellation.hpp"

#include <boost/asio/post.hpp>

#include <future>
#include <utility>

namespace memclient {

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------

CancellationToken::CancellationToken()
    : mState(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mState->mutex);
    if (mState->cancelled) return;
    mState->cancelled = true;

    auto callbacks = std::move(mState->callbacks);
    mState->callbacks.clear();
    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

CancellationToken::Registration
CancellationToken::onCancel(std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        if (!mState->cancelled) {
            const auto id = mState->nextId++;
            mState->callbacks.emplace(id, std::move(callback));
            return Registration(mState, id);
        }
    }
    callback();
    return Registration();
}

// ---------------------------------------------------------------------------
// CancellationToken::Registration
// ---------------------------------------------------------------------------

CancellationToken::Registration::Registration(std::shared_ptr<State> state,
                                              std::uint64_t id)
    : mState(state)
    , mId(id) {}

CancellationToken::Registration::~Registration() { reset(); }

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : mState(std::move(other.mState))
    , mId(std::exchange(other.mId, 0)) {}

CancellationToken::Registration&
CancellationToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        mState = std::move(other.mState);
        mId    = std::exchange(other.mId, 0);
    }
    return *this;
}

void CancellationToken::Registration::reset() {
    if (auto state = mState.lock()) {
        // Waits for a concurrently running cancel() to finish its callbacks.
        std::lock_guard<std::mutex> lock(state->mutex);
        state->callbacks.erase(mId);
    }
    mState.reset();
    mId = 0;
}

// ---------------------------------------------------------------------------
// TimerService / DeadlineTimer
// ---------------------------------------------------------------------------

TimerService::TimerService()
    : mWork(boost::asio::make_work_guard(mIoc))
    , mThread([this] { mIoc.run(); })
{}

TimerService::~TimerService() {
    mWork.reset();
    mThread.join();
}

DeadlineTimer::DeadlineTimer(TimerService& service,
                             CancellationToken token,
                             std::chrono::milliseconds timeout)
    : mIoc(service.context())
    , mState(std::make_shared<State>(mIoc))
{
    mState->timer.expires_after(timeout);
    mState->timer.async_wait([state = mState, token](const boost::system::error_code& ec) mutable {
        if (ec || state->disarmed) return;
        state->fired = true;
        token.cancel();
    });
}

DeadlineTimer::~DeadlineTimer() {
    std::promise<void> disarmed;
    auto done = disarmed.get_future();
    boost::asio::post(mIoc, [state = mState, &disarmed] {
        state->disarmed = true;
        state->timer.cancel();
        disarmed.set_value();
    });
    done.wait();
}

} // namespace memclient
