#ifndef TABWRIGHT_CDP_TRANSPORT_HPP
#define TABWRIGHT_CDP_TRANSPORT_HPP

#include <string>
#include <functional>

namespace tabwright {

// Bidirectional text-message stream under the control channel.
//
// Handlers passed to start() run on the transport's own reader thread, one
// message at a time and in arrival order. on_closed fires at most once, only
// for a drop the caller did not ask for.
class Transport {
public:
    typedef std::function<void(const std::string& text)> MessageHandler;
    typedef std::function<void(const std::string& reason)> ClosedHandler;

    virtual ~Transport() {}
    
    virtual void start(MessageHandler on_message, ClosedHandler on_closed) = 0;
    
    // Blocks until the frame is written. Throws TransportError.
    virtual void send(const std::string& text) = 0;
    
    // Idempotent. Must not be called from inside a handler.
    virtual void close() = 0;
    
    virtual bool is_open() const = 0;
};

} // namespace tabwright

#endif // TABWRIGHT_CDP_TRANSPORT_HPP
