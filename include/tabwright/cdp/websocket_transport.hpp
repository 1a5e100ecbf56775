#ifndef TABWRIGHT_CDP_WEBSOCKET_TRANSPORT_HPP
#define TABWRIGHT_CDP_WEBSOCKET_TRANSPORT_HPP

#include <tabwright/cdp/transport.hpp>
#include <memory>
#include <string>

namespace tabwright {

// Parsed ws:// or wss:// endpoint
struct ChannelAddress {
    bool secure;
    std::string host;
    std::string port;
    std::string target;           // path + query, always starts with '/'
    
    ChannelAddress() : secure(false) {}
    
    // Value for the Host header (IPv6 literals re-bracketed)
    std::string host_header() const;
};

// Throws TransportError for anything that is not a usable ws[s] URL
ChannelAddress parse_channel_address(const std::string& url);

// WebSocket transport over Boost.Beast.
//
// connect() performs resolve, TCP connect, optional TLS and the WebSocket
// upgrade on the calling thread. start() then hands the stream to a single
// I/O thread that owns every read and write; send() from other threads is
// queued onto it and waits for completion.
class WebSocketTransport : public Transport {
public:
    WebSocketTransport();
    ~WebSocketTransport();
    
    // Throws TransportError when unreachable or the handshake is rejected
    void connect(const std::string& address, int timeout_ms = 5000);
    
    void start(MessageHandler on_message, ClosedHandler on_closed);
    void send(const std::string& text);
    void close();
    bool is_open() const;

    // How long close() waits for the closing handshake
    static const int kCloseTimeoutMs = 2000;

private:
    WebSocketTransport(const WebSocketTransport&);
    WebSocketTransport& operator=(const WebSocketTransport&);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tabwright

#endif // TABWRIGHT_CDP_WEBSOCKET_TRANSPORT_HPP
