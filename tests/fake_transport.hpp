#pragma once

/// @file fake_transport.hpp
/// Scripted Transport / ByteReader doubles shared by the unit tests.

#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace memclient {
namespace fakes {

inline RawResponse jsonResponse(unsigned int status,
                                const nlohmann::json& body,
                                std::string statusText = "",
                                HeaderMap headers = {})
{
    RawResponse r;
    r.status     = status;
    r.statusText = std::move(statusText);
    r.headers    = std::move(headers);
    r.headers["Content-Type"] = "application/json";
    r.body       = body.dump();
    return r;
}

inline RawResponse emptyResponse(unsigned int status, std::string statusText = "") {
    RawResponse r;
    r.status     = status;
    r.statusText = std::move(statusText);
    return r;
}

// ---------------------------------------------------------------------------
// FakeByteReader
// ---------------------------------------------------------------------------

/// Yields the given chunks, then end of input. Counts cancel() calls in a
/// counter that outlives the reader.
class FakeByteReader : public ByteReader {
public:
    using Counter = std::shared_ptr<std::atomic<int>>;

    explicit FakeByteReader(std::vector<std::string> chunks,
                            Counter cancels = std::make_shared<std::atomic<int>>(0))
        : mChunks(std::move(chunks))
        , mCancels(std::move(cancels))
    {}

    /// Throw std::runtime_error instead of returning chunk @p index.
    void failAt(std::size_t index) { mFailAt = index; }

    /// After the last chunk, block until cancel() instead of ending.
    void blockAtEnd() { mBlockAtEnd = true; }

    std::optional<std::string> read() override {
        std::unique_lock<std::mutex> lock(mMutex);
        if (mCancelled) {
            throw TransportAborted("reader cancelled");
        }
        if (mNext == mFailAt) {
            throw std::runtime_error("connection reset by peer");
        }
        if (mNext < mChunks.size()) {
            return mChunks[mNext++];
        }
        if (mBlockAtEnd) {
            mCv.wait(lock, [this] { return mCancelled; });
            throw TransportAborted("reader cancelled");
        }
        return std::nullopt;
    }

    void cancel() override {
        ++*mCancels;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mCancelled = true;
        }
        mCv.notify_all();
    }

    Counter cancels() const { return mCancels; }

private:
    std::vector<std::string> mChunks;
    Counter                  mCancels;
    std::size_t              mNext       = 0;
    std::size_t              mFailAt     = static_cast<std::size_t>(-1);
    bool                     mBlockAtEnd = false;
    bool                     mCancelled  = false;
    std::mutex               mMutex;
    std::condition_variable  mCv;
};

inline StreamResponse streamResponse(unsigned int status,
                                     std::unique_ptr<ByteReader> reader,
                                     std::string contentType = "application/x-ndjson")
{
    StreamResponse r;
    r.status = status;
    r.headers["Content-Type"] = std::move(contentType);
    r.reader = std::move(reader);
    return r;
}

// ---------------------------------------------------------------------------
// FakeTransport
// ---------------------------------------------------------------------------

/// Replays queued responses in order (or delegates to a handler) and records
/// every request it sees. Thread-safe.
class FakeTransport : public Transport {
public:
    using SendHandler   = std::function<RawResponse(const HttpRequest&, const CancellationToken&)>;
    using StreamHandler = std::function<StreamResponse(const HttpRequest&, const CancellationToken&)>;

    void enqueue(RawResponse response) {
        std::lock_guard<std::mutex> lock(mMutex);
        mScript.push_back(std::move(response));
    }

    void enqueueStream(StreamResponse response) {
        std::lock_guard<std::mutex> lock(mMutex);
        mStreams.push_back(std::move(response));
    }

    void onSend(SendHandler handler)     { mSendHandler = std::move(handler); }
    void onStream(StreamHandler handler) { mStreamHandler = std::move(handler); }

    RawResponse send(const HttpRequest& request, const CancellationToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mRequests.push_back(request);
            if (!mSendHandler) {
                if (mScript.empty()) {
                    throw std::runtime_error("FakeTransport: no scripted response");
                }
                RawResponse next = std::move(mScript.front());
                mScript.pop_front();
                return next;
            }
        }
        return mSendHandler(request, cancel);
    }

    StreamResponse openStream(const HttpRequest& request, const CancellationToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mRequests.push_back(request);
            if (!mStreamHandler) {
                if (mStreams.empty()) {
                    throw std::runtime_error("FakeTransport: no scripted stream");
                }
                StreamResponse next = std::move(mStreams.front());
                mStreams.pop_front();
                return next;
            }
        }
        return mStreamHandler(request, cancel);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests;
    }

    std::size_t calls() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mRequests.size();
    }

private:
    mutable std::mutex         mMutex;
    std::deque<RawResponse>    mScript;
    std::deque<StreamResponse> mStreams;
    std::vector<HttpRequest>   mRequests;
    SendHandler                mSendHandler;
    StreamHandler              mStreamHandler;
};

} // namespace fakes
} // namespace memclient
