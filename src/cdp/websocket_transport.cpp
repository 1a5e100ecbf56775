#include <tabwright/cdp/websocket_transport.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>

#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace tabwright {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
typedef asio::ip::tcp tcp;

// ============================================================================
// Address parsing
// ============================================================================

std::string ChannelAddress::host_header() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + port;
    }
    return host + ":" + port;
}

ChannelAddress parse_channel_address(const std::string& url) {
    ChannelAddress addr;
    std::string rest;

    if (starts_with(url, "ws://")) {
        addr.secure = false;
        addr.port = "80";
        rest = url.substr(5);
    } else if (starts_with(url, "wss://")) {
        addr.secure = true;
        addr.port = "443";
        rest = url.substr(6);
    } else {
        throw TransportError("unsupported channel address (expected ws:// or wss://): " + url);
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    addr.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw TransportError("malformed IPv6 host in channel address: " + url);
        }
        addr.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw TransportError("malformed channel address: " + url);
            }
            addr.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            addr.host = authority.substr(0, colon);
            addr.port = authority.substr(colon + 1);
        } else {
            addr.host = authority;
        }
    }

    int64_t port_num = 0;
    if (addr.host.empty()) {
        throw TransportError("channel address has no host: " + url);
    }
    if (!parse_int64(addr.port, port_num) || port_num <= 0 || port_num > 65535) {
        throw TransportError("channel address has an invalid port: " + url);
    }
    return addr;
}

// ============================================================================
// Stream abstraction (plain and TLS WebSocket)
// ============================================================================

namespace {

typedef std::function<void(beast::error_code)> Completion;
typedef std::function<void(beast::error_code, std::size_t)> IoCompletion;

typedef websocket::stream<beast::tcp_stream> PlainWs;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream> > SecureWs;

void secure_layer(PlainWs& /*ws*/, const std::string& /*host*/, const Completion& next) {
    next(beast::error_code());
}

void secure_layer(SecureWs& ws, const std::string& host, const Completion& next) {
    // SNI; most TLS front ends refuse the handshake without it
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
        next(beast::error_code(static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()));
        return;
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws.next_layer().async_handshake(ssl::stream_base::client, next);
}

class StreamOps {
public:
    virtual ~StreamOps() {}

    virtual void async_open(const ChannelAddress& address,
                            const tcp::resolver::results_type& endpoints,
                            std::chrono::milliseconds timeout,
                            Completion done) = 0;
    virtual void async_read(beast::flat_buffer& buffer, IoCompletion done) = 0;
    virtual void async_write(const std::string& text, IoCompletion done) = 0;
    virtual void async_close(Completion done) = 0;

    // Hard-close the socket; pending operations complete with an error
    virtual void shutdown() = 0;
};

template <class Ws>
class WsStreamOps : public StreamOps {
public:
    explicit WsStreamOps(asio::io_context& ioc) : ws_(ioc) {}
    WsStreamOps(asio::io_context& ioc, ssl::context& ctx) : ws_(ioc, ctx) {}

    void async_open(const ChannelAddress& address,
                    const tcp::resolver::results_type& endpoints,
                    std::chrono::milliseconds timeout,
                    Completion done) {
        beast::get_lowest_layer(ws_).expires_after(timeout);
        beast::get_lowest_layer(ws_).async_connect(endpoints,
            [this, address, timeout, done](beast::error_code ec, const tcp::endpoint&) {
                if (ec) {
                    done(ec);
                    return;
                }
                secure_layer(ws_, address.host, [this, address, timeout, done](beast::error_code tls_ec) {
                    if (tls_ec) {
                        done(tls_ec);
                        return;
                    }
                    // The WebSocket layer enforces its own timeouts from here on
                    beast::get_lowest_layer(ws_).expires_never();

                    websocket::stream_base::timeout opt;
                    opt.handshake_timeout = timeout;
                    opt.idle_timeout = websocket::stream_base::none();
                    opt.keep_alive_pings = false;
                    ws_.set_option(opt);
                    ws_.set_option(websocket::stream_base::decorator(
                        [](websocket::request_type& req) {
                            req.set(beast::http::field::user_agent, "tabwright");
                        }));
                    ws_.read_message_max(0);  // no frame size limit
                    ws_.async_handshake(address.host_header(), address.target, done);
                });
            });
    }

    void async_read(beast::flat_buffer& buffer, IoCompletion done) {
        ws_.async_read(buffer, done);
    }

    void async_write(const std::string& text, IoCompletion done) {
        ws_.text(true);
        ws_.async_write(asio::buffer(text), done);
    }

    void async_close(Completion done) {
        ws_.async_close(websocket::close_code::normal, done);
    }

    void shutdown() {
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(ws_).socket().close(ec);
    }

private:
    Ws ws_;
};

struct OutgoingFrame {
    std::string text;
    std::shared_ptr<std::promise<beast::error_code> > done;
};

} // namespace

// ============================================================================
// Implementation state
// ============================================================================

struct WebSocketTransport::Impl {
    asio::io_context ioc;
    ssl::context ssl_ctx;
    std::unique_ptr<StreamOps> stream;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type> > work;
    std::thread io_thread;

    // Touched only on the I/O thread
    beast::flat_buffer read_buffer;
    std::deque<OutgoingFrame> outbox;

    MessageHandler on_message;
    ClosedHandler on_closed;
    std::string address;

    mutable std::mutex state_mutex;
    bool open;
    bool closed;                  // close() was requested
    bool drop_reported;

    Impl()
        : ssl_ctx(ssl::context::tls_client)
        , open(false)
        , closed(false)
        , drop_reported(false) {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(ssl::verify_peer);
    }

    void read_next() {
        stream->async_read(read_buffer, [this](beast::error_code ec, std::size_t) {
            if (ec) {
                handle_drop(ec);
                return;
            }
            std::string text = beast::buffers_to_string(read_buffer.data());
            read_buffer.consume(read_buffer.size());
            if (on_message) {
                try {
                    on_message(text);
                } catch (const std::exception& e) {
                    LOG_WARN("[channel] message handler failed: %s", e.what());
                }
            }
            read_next();
        });
    }

    void write_next() {
        stream->async_write(outbox.front().text, [this](beast::error_code ec, std::size_t) {
            std::shared_ptr<std::promise<beast::error_code> > done = outbox.front().done;
            outbox.pop_front();
            done->set_value(ec);
            if (!outbox.empty()) {
                write_next();
            }
        });
    }

    void handle_drop(const beast::error_code& ec) {
        bool notify = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            open = false;
            if (!closed && !drop_reported) {
                drop_reported = true;
                notify = true;
            }
        }
        if (!notify) return;

        std::string reason = ec == websocket::error::closed
            ? std::string("remote end closed the channel")
            : "connection lost: " + ec.message();
        LOG_WARN("[channel] %s (%s)", reason.c_str(), address.c_str());
        if (on_closed) {
            try {
                on_closed(reason);
            } catch (const std::exception& e) {
                LOG_WARN("[channel] close handler failed: %s", e.what());
            }
        }
    }
};

// ============================================================================
// WebSocketTransport
// ============================================================================

const int WebSocketTransport::kCloseTimeoutMs;

WebSocketTransport::WebSocketTransport()
    : impl_(new Impl()) {
}

WebSocketTransport::~WebSocketTransport() {
    close();
    if (impl_->io_thread.joinable()) {
        impl_->work.reset();
        impl_->ioc.stop();
        impl_->io_thread.join();
    }
}

void WebSocketTransport::connect(const std::string& address, int timeout_ms) {
    ChannelAddress parsed = parse_channel_address(address);
    impl_->address = address;

    if (parsed.secure) {
        impl_->stream.reset(new WsStreamOps<SecureWs>(impl_->ioc, impl_->ssl_ctx));
    } else {
        impl_->stream.reset(new WsStreamOps<PlainWs>(impl_->ioc));
    }

    beast::error_code result = asio::error::would_block;
    tcp::resolver resolver(impl_->ioc);
    StreamOps* stream = impl_->stream.get();
    std::chrono::milliseconds timeout(timeout_ms > 0 ? timeout_ms : 5000);

    resolver.async_resolve(parsed.host, parsed.port,
        [&result, stream, parsed, timeout](beast::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                result = ec;
                return;
            }
            stream->async_open(parsed, endpoints, timeout, [&result](beast::error_code open_ec) {
                result = open_ec;
            });
        });

    // Runs until the chain above has nothing left to do
    impl_->ioc.run();
    impl_->ioc.restart();

    if (result) {
        impl_->stream->shutdown();
        throw TransportError("cannot connect to " + address + ": " + result.message());
    }

    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->open = true;
    LOG_DEBUG("[channel] connected to %s", address.c_str());
}

void WebSocketTransport::start(MessageHandler on_message, ClosedHandler on_closed) {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!impl_->open) {
            throw TransportError("transport is not connected");
        }
        if (impl_->io_thread.joinable()) {
            throw TransportError("transport already started");
        }
    }

    impl_->on_message = on_message;
    impl_->on_closed = on_closed;
    impl_->work.reset(new asio::executor_work_guard<asio::io_context::executor_type>(
        asio::make_work_guard(impl_->ioc)));

    Impl* impl = impl_.get();
    asio::post(impl_->ioc, [impl]() { impl->read_next(); });
    impl_->io_thread = std::thread([impl]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("[channel] I/O thread failed: %s", e.what());
        }
    });
}

void WebSocketTransport::send(const std::string& text) {
    std::shared_ptr<std::promise<beast::error_code> > done =
        std::make_shared<std::promise<beast::error_code> >();
    std::future<beast::error_code> written = done->get_future();

    {
        // Posting under the lock orders this frame before any drain in close()
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!impl_->open || !impl_->io_thread.joinable()) {
            throw TransportError("channel is not open");
        }
        Impl* impl = impl_.get();
        asio::post(impl_->ioc, [impl, text, done]() {
            OutgoingFrame frame;
            frame.text = text;
            frame.done = done;
            impl->outbox.push_back(frame);
            if (impl->outbox.size() == 1) {
                impl->write_next();
            }
        });
    }

    beast::error_code ec = written.get();
    if (ec) {
        throw TransportError("write failed: " + ec.message());
    }
}

void WebSocketTransport::close() {
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (impl_->closed) return;
        impl_->closed = true;
        started = impl_->io_thread.joinable();
    }

    if (!impl_->stream) return;

    if (started) {
        if (std::this_thread::get_id() == impl_->io_thread.get_id()) {
            // Cannot join ourselves; the destructor finishes the job
            LOG_WARN("[channel] close() called on the I/O thread");
            impl_->stream->shutdown();
            impl_->ioc.stop();
            return;
        }

        bool was_open;
        {
            std::lock_guard<std::mutex> lock(impl_->state_mutex);
            was_open = impl_->open;
        }

        if (was_open) {
            std::shared_ptr<std::promise<void> > closed = std::make_shared<std::promise<void> >();
            std::future<void> closed_future = closed->get_future();
            Impl* impl = impl_.get();
            asio::post(impl_->ioc, [impl, closed]() {
                impl->stream->async_close([closed](beast::error_code ec) {
                    if (ec) {
                        LOG_DEBUG("[channel] close handshake: %s", ec.message().c_str());
                    }
                    closed->set_value();
                });
            });
            if (closed_future.wait_for(std::chrono::milliseconds(kCloseTimeoutMs)) !=
                std::future_status::ready) {
                LOG_DEBUG("[channel] close handshake timed out");
            }
        }

        {
            std::lock_guard<std::mutex> lock(impl_->state_mutex);
            impl_->open = false;
        }

        impl_->stream->shutdown();
        impl_->work.reset();
        impl_->ioc.stop();
        impl_->io_thread.join();
    } else {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->open = false;
    }

    // Fail queued writes and let aborted operations run their handlers
    impl_->stream->shutdown();
    impl_->ioc.restart();
    impl_->ioc.poll();
    while (!impl_->outbox.empty()) {
        impl_->outbox.front().done->set_value(asio::error::operation_aborted);
        impl_->outbox.pop_front();
    }

    LOG_DEBUG("[channel] closed %s", impl_->address.c_str());
}

bool WebSocketTransport::is_open() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->open;
}

} // namespace tabwright
