#include "ndjson.hpp"
#include "util.hpp"

#include <iostream>

namespace memclient {

std::string describe(const StreamError& error) {
    return std::visit(overloaded{
        [](const ClientError& e) { return describe(e); },
        [](const JsonParseError& e) {
            return "JsonParseError: " + e.message + " (line: " + e.rawLine + ")";
        },
    }, error);
}

NdjsonDecoder::NdjsonDecoder(TailPolicy tail)
    : mTailPolicy(tail)
{}

void NdjsonDecoder::feed(std::string_view chunk) {
    if (mInputEnded || mState == DecoderState::Done || mState == DecoderState::Error) {
        return;
    }

    mFragment.append(chunk.data(), chunk.size());

    std::size_t start = 0;
    for (std::size_t nl = mFragment.find('\n'); nl != std::string::npos;
         nl = mFragment.find('\n', start)) {
        std::string line = mFragment.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        mLines.push_back(std::move(line));
        start = nl + 1;
    }
    mFragment.erase(0, start);

    if (!mLines.empty()) {
        mState = DecoderState::Emitting;
    }
}

void NdjsonDecoder::finish() {
    mInputEnded = true;
}

std::optional<JsonParseError>
NdjsonDecoder::parseInto(const std::string& line, DecodedLine& out) const {
    try {
        out.value = nlohmann::json::parse(line);
        out.raw   = line;
        return std::nullopt;
    } catch (const nlohmann::json::parse_error& e) {
        return JsonParseError{e.what(), line};
    }
}

Result<std::optional<DecodedLine>, JsonParseError> NdjsonDecoder::next() {
    if (mState == DecoderState::Error) {
        return *mError;
    }
    if (mState == DecoderState::Done) {
        return std::optional<DecodedLine>{};
    }

    // --- complete lines ---
    while (!mLines.empty()) {
        std::string line = std::move(mLines.front());
        mLines.pop_front();
        if (isBlank(line)) {
            continue;
        }

        DecodedLine decoded;
        if (auto error = parseInto(line, decoded)) {
            mState = DecoderState::Error;
            mError = std::move(error);
            return *mError;
        }
        return std::optional<DecodedLine>(std::move(decoded));
    }

    if (!mInputEnded) {
        mState = DecoderState::Reading;
        return std::optional<DecodedLine>{};
    }

    // --- end of input: flush the unterminated fragment once ---
    if (!mTailFlushed) {
        mTailFlushed = true;
        std::string tail = std::move(mFragment);
        mFragment.clear();

        std::string trimmed = trim(tail);
        if (!trimmed.empty()) {
            DecodedLine decoded;
            if (auto error = parseInto(trimmed, decoded)) {
                if (mTailPolicy == TailPolicy::Strict) {
                    mState = DecoderState::Error;
                    mError = std::move(error);
                    return *mError;
                }
                std::cerr << "[Ndjson] WARNING: discarding truncated final line ("
                          << trimmed.size() << " bytes): " << error->message << "\n";
                mTruncatedTail = std::move(trimmed);
            } else {
                mState = DecoderState::Emitting;
                return std::optional<DecodedLine>(std::move(decoded));
            }
        }
    }

    mState = DecoderState::Done;
    return std::optional<DecodedLine>{};
}

} // namespace memclient
