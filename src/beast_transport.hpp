#pragma once

#include "transport.hpp"

#ifdef MEMCLIENT_HAS_SSL
#include <boost/asio/ssl/context.hpp>
#endif

namespace memclient {

/// Boost.Beast HTTP/1.1 transport, one connection per call.
///
/// Blocking from the caller's point of view; every socket operation runs
/// on a private io_context so that cancellation from another thread can
/// close the socket and unblock the caller.  HTTPS requires building
/// with MEMCLIENT_HAS_SSL (OpenSSL).
class BeastTransport : public Transport {
public:
    BeastTransport();

    RawResponse    send(const HttpRequest& request, const CancellationToken& cancel) override;
    StreamResponse openStream(const HttpRequest& request, const CancellationToken& cancel) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
#ifdef MEMCLIENT_HAS_SSL
    boost::asio::ssl::context mTls;
#endif
    bool mVerbose = false;
};

} // namespace memclient
