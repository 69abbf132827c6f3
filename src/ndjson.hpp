#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "transport.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace memclient {

/// A complete NDJSON line that is not valid JSON (or not the expected record shape).
struct JsonParseError {
    std::string message;
    std::string rawLine;
};

/// Failure of a record stream: upstream (network) or decode.
using StreamError = std::variant<ClientError, JsonParseError>;

std::string describe(const StreamError& error);

enum class DecoderState { Reading, Emitting, Done, Error };

/// Handling of a non-blank final line that has no trailing newline and does not parse.
enum class TailPolicy {
    Salvage,   // warn, expose it through truncatedTail(), end normally
    Strict,    // fail like any malformed line
};

struct DecodedLine {
    std::string    raw;
    nlohmann::json value;
};

// ---------------------------------------------------------------------------
// NdjsonDecoder: push chunks in, pull parsed lines out.
// ---------------------------------------------------------------------------

class NdjsonDecoder {
public:
    explicit NdjsonDecoder(TailPolicy tail = TailPolicy::Salvage);

    /// Append a chunk. Ignored once the decoder is Done or in Error.
    void feed(std::string_view chunk);

    /// Signal end of input. The pending fragment is flushed exactly once.
    void finish();

    /// Next parsed line, or std::nullopt when more input is needed
    /// (state() == Reading) or the stream is over (state() == Done).
    /// After an error every call returns that same error.
    Result<std::optional<DecodedLine>, JsonParseError> next();

    DecoderState state() const { return mState; }

    /// Unparseable final fragment kept under TailPolicy::Salvage.
    const std::optional<std::string>& truncatedTail() const { return mTruncatedTail; }

private:
    std::optional<JsonParseError> parseInto(const std::string& line, DecodedLine& out) const;

    TailPolicy                    mTailPolicy;
    DecoderState                  mState = DecoderState::Reading;
    std::string                   mFragment;
    std::deque<std::string>       mLines;
    bool                          mInputEnded = false;
    bool                          mTailFlushed = false;
    std::optional<JsonParseError> mError;
    std::optional<std::string>    mTruncatedTail;
};

// ---------------------------------------------------------------------------
// RecordStream<T>: lazy, finite, non-restartable sequence of records read
// from a ByteReader and converted line by line.
//
// Stopping early (cancel(), destruction or the optional token firing)
// cancels the reader exactly once. cancel() and the token may fire from
// another thread while next() is blocked.
// ---------------------------------------------------------------------------

template <typename T>
class RecordStream {
public:
    using LineParser = std::function<T(const nlohmann::json&)>;
    using Step       = Result<std::optional<T>, StreamError>;

    RecordStream(std::unique_ptr<ByteReader> reader,
                 LineParser parser,
                 TailPolicy tail = TailPolicy::Salvage,
                 std::string url = {},
                 const std::optional<CancellationToken>& cancel = std::nullopt)
        : mCore(std::make_unique<Core>(std::move(reader)))
        , mParse(std::move(parser))
        , mDecoder(tail)
        , mUrl(std::move(url))
    {
        if (!mCore->reader) {
            throw std::invalid_argument("RecordStream requires a reader");
        }
        if (cancel) {
            Core* core = mCore.get();
            mRegistration = cancel->onCancel([core] { core->stop(); });
        }
    }

    RecordStream(RecordStream&& other)
        : mCore(std::move(other.mCore))
        , mParse(std::move(other.mParse))
        , mDecoder(std::move(other.mDecoder))
        , mUrl(std::move(other.mUrl))
        , mFailure(std::move(other.mFailure))
        , mRegistration(std::move(other.mRegistration))
    {}

    RecordStream(const RecordStream&) = delete;
    RecordStream& operator=(const RecordStream&) = delete;
    RecordStream& operator=(RecordStream&&) = delete;

    ~RecordStream() {
        mRegistration.reset();
        cancel();
    }

    /// Next record, std::nullopt at the end of the stream (or after cancel()).
    Step next();

    /// Drain the remaining records.
    Result<std::vector<T>, StreamError> collect();

    void cancel() {
        if (mCore) {
            mCore->stop();
        }
    }

    bool finished() const { return !mCore || mCore->terminal.load(); }

    const std::optional<std::string>& truncatedTail() const { return mDecoder.truncatedTail(); }

private:
    // Heap-allocated so the token callback keeps a stable address across moves.
    struct Core {
        explicit Core(std::unique_ptr<ByteReader> r) : reader(std::move(r)) {}

        void stop() {
            cancelled.store(true);
            if (!terminal.exchange(true)) {
                reader->cancel();
            }
        }

        std::unique_ptr<ByteReader> reader;
        std::atomic<bool>           terminal{false};
        std::atomic<bool>           cancelled{false};
    };

    Step fail(StreamError error) {
        mFailure = error;
        if (!mCore->terminal.exchange(true)) {
            mCore->reader->cancel();
        }
        return Step(std::move(error));
    }

    std::unique_ptr<Core>           mCore;
    LineParser                      mParse;
    NdjsonDecoder                   mDecoder;
    std::string                     mUrl;
    std::optional<StreamError>      mFailure;
    CancellationToken::Registration mRegistration;
};

template <typename T>
typename RecordStream<T>::Step RecordStream<T>::next() {
    if (mFailure) {
        return Step(*mFailure);
    }
    if (!mCore) {
        return Step(std::optional<T>{});
    }

    for (;;) {
        if (mCore->cancelled.load()) {
            return Step(std::optional<T>{});
        }

        auto line = mDecoder.next();
        if (!line.ok()) {
            return fail(StreamError(line.error()));
        }

        if (line.value()) {
            DecodedLine& decoded = *line.value();
            try {
                return Step(std::optional<T>(mParse(decoded.value)));
            } catch (const std::exception& e) {
                return fail(StreamError(JsonParseError{e.what(), decoded.raw}));
            }
        }

        if (mDecoder.state() == DecoderState::Done) {
            mCore->terminal.store(true);
            return Step(std::optional<T>{});
        }

        std::optional<std::string> chunk;
        try {
            chunk = mCore->reader->read();
        } catch (const std::exception& e) {
            if (mCore->cancelled.load()) {
                return Step(std::optional<T>{});
            }
            return fail(StreamError(ClientError(NetworkError{e.what(), mUrl})));
        }

        if (chunk) {
            mDecoder.feed(*chunk);
        } else {
            mDecoder.finish();
        }
    }
}

template <typename T>
Result<std::vector<T>, StreamError> RecordStream<T>::collect() {
    std::vector<T> records;
    for (;;) {
        auto step = next();
        if (!step.ok()) {
            return Result<std::vector<T>, StreamError>(step.error());
        }
        if (!step.value()) {
            return Result<std::vector<T>, StreamError>(std::move(records));
        }
        records.push_back(std::move(*step.value()));
    }
}

} // namespace memclient
