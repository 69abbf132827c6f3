#include "beast_transport.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

#ifdef MEMCLIENT_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace memclient {

namespace {

#ifdef MEMCLIENT_HAS_SSL
using TlsContext = net::ssl::context;
constexpr auto kShutdownTimeout = std::chrono::seconds(5);
#else
struct TlsContext {};
#endif

constexpr std::size_t kChunkSize = 8 * 1024;

std::string toStd(beast::string_view text) {
    return std::string(text.data(), text.size());
}

http::verb toVerb(Method method) {
    switch (method) {
        case Method::Get:    return http::verb::get;
        case Method::Post:   return http::verb::post;
        case Method::Put:    return http::verb::put;
        case Method::Patch:  return http::verb::patch;
        case Method::Delete: return http::verb::delete_;
    }
    return http::verb::get;
}

std::string hostHeader(const UrlParts& url) {
    const bool defaultPort = (url.scheme == "http" && url.port == "80") ||
                             (url.scheme == "https" && url.port == "443");
    return defaultPort ? url.host : url.host + ":" + url.port;
}

/// Repeated fields are folded into one comma-separated value.
template <class Fields>
HeaderMap copyHeaders(const Fields& fields) {
    HeaderMap out;
    for (const auto& field : fields) {
        auto name  = toStd(field.name_string());
        auto value = toStd(field.value());
        auto it = out.find(name);
        if (it == out.end()) {
            out.emplace(std::move(name), std::move(value));
        } else {
            it->second += ", " + value;
        }
    }
    return out;
}

http::request<http::string_body> makeRequest(const HttpRequest& request, const UrlParts& url) {
    http::request<http::string_body> req{toVerb(request.method), url.target, 11};
    req.set(http::field::host, hostHeader(url));
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (request.body) {
        req.body() = *request.body;
    }
    req.prepare_payload();
    return req;
}

// ---------------------------------------------------------------------------
// Connection: one socket plus the io_context that drives it.
//
// Every operation is started asynchronously and completed by running the
// io_context on the calling thread.  abort() may be called from any thread;
// it posts the socket close onto the same io_context.
// ---------------------------------------------------------------------------

class Connection {
public:
    Connection(const UrlParts& url, TlsContext* tls)
        : mHost(url.host)
        , mPort(url.port)
        , mResolver(mIoc)
    {
        if (url.scheme == "https") {
#ifdef MEMCLIENT_HAS_SSL
            mSsl.emplace(mIoc, *tls);
            // SNI hostname.
            if (!SSL_set_tlsext_host_name(mSsl->native_handle(), mHost.c_str())) {
                throw std::runtime_error("Failed to set SNI hostname");
            }
            mSsl->set_verify_callback(net::ssl::host_name_verification(mHost));
#else
            (void)tls;
            throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
        } else {
            mPlain.emplace(mIoc);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void connect() {
        throwIfAborted();

        beast::error_code ec;
        tcp::resolver::results_type endpoints;
        mResolver.async_resolve(mHost, mPort,
            [&](beast::error_code e, tcp::resolver::results_type results) {
                ec        = e;
                endpoints = std::move(results);
            });
        drive(ec);

        tcpLayer().async_connect(endpoints,
            [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
        drive(ec);

#ifdef MEMCLIENT_HAS_SSL
        if (mSsl) {
            mSsl->async_handshake(net::ssl::stream_base::client,
                [&](beast::error_code e) { ec = e; });
            drive(ec);
        }
#endif
    }

    template <class Message>
    void write(Message& message) {
        throwIfAborted();
        beast::error_code ec;
        withStream([&](auto& stream) {
            http::async_write(stream, message,
                [&](beast::error_code e, std::size_t) { ec = e; });
        });
        drive(ec);
    }

    template <class Message>
    void read(beast::flat_buffer& buffer, Message& message) {
        throwIfAborted();
        beast::error_code ec;
        withStream([&](auto& stream) {
            http::async_read(stream, buffer, message,
                [&](beast::error_code e, std::size_t) { ec = e; });
        });
        drive(ec);
    }

    template <class Parser>
    void readHeader(beast::flat_buffer& buffer, Parser& parser) {
        throwIfAborted();
        beast::error_code ec;
        withStream([&](auto& stream) {
            http::async_read_header(stream, buffer, parser,
                [&](beast::error_code e, std::size_t) { ec = e; });
        });
        drive(ec);
    }

    /// need_buffer only means the caller's body buffer is full.
    template <class Parser>
    void readSome(beast::flat_buffer& buffer, Parser& parser) {
        throwIfAborted();
        beast::error_code ec;
        withStream([&](auto& stream) {
            http::async_read_some(stream, buffer, parser,
                [&](beast::error_code e, std::size_t) {
                    ec = (e == http::error::need_buffer) ? beast::error_code{} : e;
                });
        });
        drive(ec);
    }

    /// Graceful shutdown (non-critical errors are swallowed).
    void shutdown() {
#ifdef MEMCLIENT_HAS_SSL
        if (mSsl) {
            tcpLayer().expires_after(kShutdownTimeout);
            mSsl->async_shutdown([](beast::error_code) {});
            mIoc.restart();
            mIoc.run();
            return;
        }
#endif
        beast::error_code ec;
        mPlain->socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    void abort() {
        if (mAborted.exchange(true)) {
            return;
        }
        net::post(mIoc, [this] {
            beast::error_code ec;
            mResolver.cancel();
            tcpLayer().socket().close(ec);
        });
    }

    bool aborted() const { return mAborted.load(); }

    /// Run handlers that are already queued (e.g. a posted abort).
    void poll() {
        mIoc.restart();
        mIoc.poll();
    }

private:
    beast::tcp_stream& tcpLayer() {
#ifdef MEMCLIENT_HAS_SSL
        if (mSsl) {
            return beast::get_lowest_layer(*mSsl);
        }
#endif
        return *mPlain;
    }

    template <class F>
    void withStream(F&& f) {
#ifdef MEMCLIENT_HAS_SSL
        if (mSsl) {
            f(*mSsl);
            return;
        }
#endif
        f(*mPlain);
    }

    void throwIfAborted() const {
        if (mAborted.load()) {
            throw TransportAborted("Request aborted");
        }
    }

    void drive(const beast::error_code& ec) {
        mIoc.restart();
        mIoc.run();
        throwIfAborted();
        if (ec) {
            throw beast::system_error(ec);
        }
    }

    std::string                      mHost;
    std::string                      mPort;
    net::io_context                  mIoc;
    tcp::resolver                    mResolver;
    std::optional<beast::tcp_stream> mPlain;
#ifdef MEMCLIENT_HAS_SSL
    std::optional<beast::ssl_stream<beast::tcp_stream>> mSsl;
#endif
    std::atomic<bool>                mAborted{false};
};

// ---------------------------------------------------------------------------
// Streaming body reader
// ---------------------------------------------------------------------------

class BeastByteReader : public ByteReader {
public:
    using Parser = http::response_parser<http::buffer_body>;

    BeastByteReader(std::unique_ptr<Connection> connection,
                    beast::flat_buffer buffer,
                    std::unique_ptr<Parser> parser)
        : mConnection(std::move(connection))
        , mBuffer(std::move(buffer))
        , mParser(std::move(parser))
    {}

    std::optional<std::string> read() override {
        std::lock_guard<std::mutex> lock(mIoMutex);
        while (!mFinished) {
            if (mParser->is_done()) {
                mFinished = true;
                mConnection->shutdown();
                break;
            }

            auto& body = mParser->get().body();
            body.data  = mChunk.data();
            body.size  = mChunk.size();
            mConnection->readSome(mBuffer, *mParser);

            const std::size_t n = mChunk.size() - body.size;
            if (n > 0) {
                return std::string(mChunk.data(), n);
            }
        }
        return std::nullopt;
    }

    void cancel() override {
        mConnection->abort();
        // A read in progress runs the posted close itself.
        std::unique_lock<std::mutex> lock(mIoMutex, std::try_to_lock);
        if (lock.owns_lock()) {
            mConnection->poll();
        }
    }

private:
    std::unique_ptr<Connection>     mConnection;
    beast::flat_buffer              mBuffer;
    std::unique_ptr<Parser>         mParser;
    std::array<char, kChunkSize>    mChunk{};
    std::mutex                      mIoMutex;
    bool                            mFinished = false;
};

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport()
#ifdef MEMCLIENT_HAS_SSL
    : mTls(net::ssl::context::tlsv12_client)
#endif
{
#ifdef MEMCLIENT_HAS_SSL
    mTls.set_default_verify_paths();
    mTls.set_verify_mode(net::ssl::verify_peer);
#endif
}

// ---------------------------------------------------------------------------
// Buffered request
// ---------------------------------------------------------------------------

RawResponse BeastTransport::send(const HttpRequest& request, const CancellationToken& cancel)
{
    const UrlParts url = parseUrl(request.url);

    TlsContext* tls = nullptr;
#ifdef MEMCLIENT_HAS_SSL
    tls = &mTls;
#endif

    Connection connection(url, tls);
    auto abortLink = cancel.onCancel([&connection] { connection.abort(); });

    if (mVerbose) {
        std::cerr << "[Transport] Connecting to " << url.host << ":" << url.port << "\n";
    }
    connection.connect();

    auto req = makeRequest(request, url);
    connection.write(req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    connection.read(buffer, res);

    RawResponse raw;
    raw.status     = res.result_int();
    raw.statusText = toStd(res.reason());
    raw.headers    = copyHeaders(res);
    raw.body       = std::move(res.body());

    abortLink.reset();
    connection.shutdown();
    return raw;
}

// ---------------------------------------------------------------------------
// Streaming request
// ---------------------------------------------------------------------------

StreamResponse BeastTransport::openStream(const HttpRequest& request, const CancellationToken& cancel)
{
    const UrlParts url = parseUrl(request.url);

    TlsContext* tls = nullptr;
#ifdef MEMCLIENT_HAS_SSL
    tls = &mTls;
#endif

    auto connection = std::make_unique<Connection>(url, tls);
    auto abortLink  = cancel.onCancel([conn = connection.get()] { conn->abort(); });

    if (mVerbose) {
        std::cerr << "[Transport] Opening stream to " << url.host << ":" << url.port << "\n";
    }
    connection->connect();

    auto req = makeRequest(request, url);
    connection->write(req);

    beast::flat_buffer buffer;
    auto parser = std::make_unique<BeastByteReader::Parser>();
    parser->body_limit((std::numeric_limits<std::uint64_t>::max)());
    connection->readHeader(buffer, *parser);

    // From here on the reader's own cancel() is the only way to stop the stream.
    abortLink.reset();

    StreamResponse out;
    out.status     = parser->get().result_int();
    out.statusText = toStd(parser->get().reason());
    out.headers    = copyHeaders(parser->get());
    out.reader     = std::make_unique<BeastByteReader>(std::move(connection),
                                                       std::move(buffer),
                                                       std::move(parser));
    return out;
}

} // namespace memclient
