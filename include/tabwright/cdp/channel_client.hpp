#ifndef TABWRIGHT_CDP_CHANNEL_CLIENT_HPP
#define TABWRIGHT_CDP_CHANNEL_CLIENT_HPP

#include <tabwright/cdp/command_sender.hpp>
#include <tabwright/cdp/transport.hpp>
#include <tabwright/core/json.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace tabwright {

// ============================================================================
// ChannelClient
// ============================================================================
//
// Request/response correlator over one Transport. Any number of threads may
// have call() outstanding; responses are matched strictly by id, whatever
// order they arrive in. Messages without an id are events: they are queued
// and handed to the event sink in arrival order on a separate dispatch
// thread, so a slow sink never holds up a response.
//
// Teardown fails every pending waiter: close() with ChannelClosed, a remote
// drop with TransportError. Nothing stays suspended.

class ChannelClient : public CommandSender {
public:
    typedef std::function<void(const std::string& method, const Json& params)> EventSink;
    typedef std::function<void()> ActivityHook;

    // Starts reading immediately
    explicit ChannelClient(std::unique_ptr<Transport> transport);
    ~ChannelClient();

    // Connect a WebSocketTransport to `address` and wrap it.
    // Throws TransportError.
    static std::unique_ptr<ChannelClient> connect(const std::string& address,
                                                  int timeout_ms = 5000);

    Json call(const std::string& method, const Json& params = Json::object());

    // Idempotent. Fails pending calls with ChannelClosed, then closes the
    // transport; a transport error from that last step is rethrown.
    void close();

    bool is_open() const;

    // Runs on the dispatch thread; events stay in arrival order
    void set_event_sink(EventSink sink);

    // Runs on the reader thread for every response and must not block
    void set_activity_hook(ActivityHook hook);

    size_t pending_count() const;
    int64_t last_request_id() const;

    // Wire form of a request; params omitted when empty
    static std::string encode_request(int64_t id, const std::string& method, const Json& params);

private:
    ChannelClient(const ChannelClient&);
    ChannelClient& operator=(const ChannelClient&);

    enum class Outcome { PENDING, RESULT, REMOTE_ERROR, CLOSED, DROPPED };

    struct PendingCall {
        Outcome outcome;
        Json payload;
        std::string reason;

        PendingCall() : outcome(Outcome::PENDING) {}
    };

    void on_message(const std::string& text);
    void on_closed(const std::string& reason);
    void fail_all(Outcome outcome, const std::string& reason);
    void dispatch_events();

    std::unique_ptr<Transport> transport_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int64_t, std::shared_ptr<PendingCall> > pending_;
    int64_t next_id_;
    bool closed_;
    std::string closed_reason_;

    std::mutex sink_mutex_;
    EventSink event_sink_;
    ActivityHook activity_hook_;

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<std::pair<std::string, Json> > events_;
    bool dispatch_stop_;
    std::thread dispatcher_;
};

} // namespace tabwright

#endif // TABWRIGHT_CDP_CHANNEL_CLIENT_HPP
