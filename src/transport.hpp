#pragma once

#include "cancellation.hpp"
#include "models.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace memclient {

/// Thrown by a transport whose call was aborted through its cancellation token.
class TransportAborted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Response as it came off the wire, before classification.
struct RawResponse {
    unsigned int status = 0;
    std::string  statusText;
    HeaderMap    headers;
    std::string  body;
};

/// Pull-based source of response body bytes.
class ByteReader {
public:
    virtual ~ByteReader() = default;

    /// Next chunk, or std::nullopt at end of input. Blocks until data arrives.
    /// Throws on I/O failure, TransportAborted after cancel().
    virtual std::optional<std::string> read() = 0;

    /// Abort any pending read and release the connection. Callable from any thread.
    virtual void cancel() = 0;
};

struct StreamResponse {
    unsigned int                status = 0;
    std::string                 statusText;
    HeaderMap                   headers;
    std::unique_ptr<ByteReader> reader;
};

/// The I/O seam. Production code uses BeastTransport; tests substitute fakes.
/// Implementations throw on transport failure and must abort promptly
/// (throwing TransportAborted) once @p cancel fires.
class Transport {
public:
    virtual ~Transport() = default;

    virtual RawResponse    send(const HttpRequest& request, const CancellationToken& cancel) = 0;
    virtual StreamResponse openStream(const HttpRequest& request, const CancellationToken& cancel) = 0;
};

} // namespace memclient
