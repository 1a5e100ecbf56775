#include <tabwright/cdp/channel_client.hpp>
#include <tabwright/cdp/websocket_transport.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>

namespace tabwright {

ChannelClient::ChannelClient(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport))
    , next_id_(1)
    , closed_(false)
    , dispatch_stop_(false) {
    transport_->start(
        [this](const std::string& text) { on_message(text); },
        [this](const std::string& reason) { on_closed(reason); });
    dispatcher_ = std::thread(&ChannelClient::dispatch_events, this);
}

ChannelClient::~ChannelClient() {
    try {
        close();
    } catch (const std::exception& e) {
        LOG_DEBUG("[channel] error while closing: %s", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        dispatch_stop_ = true;
    }
    events_cv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

std::unique_ptr<ChannelClient> ChannelClient::connect(const std::string& address, int timeout_ms) {
    std::unique_ptr<WebSocketTransport> ws(new WebSocketTransport());
    ws->connect(address, timeout_ms);
    LOG_INFO("[channel] connected to %s", address.c_str());
    return std::unique_ptr<ChannelClient>(new ChannelClient(std::move(ws)));
}

std::string ChannelClient::encode_request(int64_t id, const std::string& method, const Json& params) {
    Json msg = Json::object();
    msg["id"] = id;
    msg["method"] = method;
    if (!params.is_null() && !(params.is_object() && params.empty())) {
        msg["params"] = params;
    }
    return msg.dump();
}

// ============================================================================
// Requests
// ============================================================================

Json ChannelClient::call(const std::string& method, const Json& params) {
    std::shared_ptr<PendingCall> pending = std::make_shared<PendingCall>();
    int64_t id = 0;
    std::string wire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw ChannelClosed(method + ": " + closed_reason_);
        }
        id = next_id_++;
        wire = encode_request(id, method, params);
        pending_[id] = pending;
    }

    try {
        transport_->send(wire);
    } catch (const TransportError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        // Teardown may already have resolved this id
        if (pending->outcome == Outcome::PENDING) {
            pending_.erase(id);
            pending->outcome = Outcome::DROPPED;
            pending->reason = e.what();
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&pending]() { return pending->outcome != Outcome::PENDING; });

    switch (pending->outcome) {
        case Outcome::RESULT:
            return pending->payload;
        case Outcome::REMOTE_ERROR:
            throw ProtocolError(method, pending->payload);
        case Outcome::CLOSED:
            throw ChannelClosed(method + " aborted: " + pending->reason);
        default:
            throw TransportError(method + " aborted: " + pending->reason);
    }
}

// ============================================================================
// Inbound dispatch (reader thread)
// ============================================================================

void ChannelClient::on_message(const std::string& text) {
    Json message;
    try {
        message = Json::parse(text);
    } catch (const Json::parse_error& e) {
        LOG_WARN("[channel] dropping malformed message: %s", e.what());
        return;
    }
    if (!message.is_object()) {
        LOG_WARN("[channel] dropping non-object message");
        return;
    }

    Json::const_iterator id_it = message.find("id");
    if (id_it != message.end() && id_it->is_number_integer()) {
        int64_t id = id_it->get<int64_t>();
        bool matched = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::map<int64_t, std::shared_ptr<PendingCall> >::iterator it = pending_.find(id);
            if (it != pending_.end()) {
                PendingCall& call = *it->second;
                Json::const_iterator err = message.find("error");
                if (err != message.end()) {
                    call.outcome = Outcome::REMOTE_ERROR;
                    call.payload = *err;
                } else {
                    Json::const_iterator res = message.find("result");
                    call.outcome = Outcome::RESULT;
                    call.payload = res != message.end() ? *res : Json::object();
                }
                pending_.erase(it);
                matched = true;
            }
        }

        if (!matched) {
            LOG_DEBUG("[channel] response for unknown id %lld", static_cast<long long>(id));
            return;
        }
        cv_.notify_all();

        ActivityHook hook;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            hook = activity_hook_;
        }
        if (hook) hook();
        return;
    }

    Json::const_iterator method_it = message.find("method");
    if (method_it != message.end() && method_it->is_string()) {
        std::string method = method_it->get<std::string>();
        Json::const_iterator params_it = message.find("params");
        Json params = params_it != message.end() ? *params_it : Json::object();

        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(std::make_pair(method, params));
        }
        events_cv_.notify_one();
        return;
    }

    LOG_DEBUG("[channel] ignoring message with neither id nor method");
}

// ============================================================================
// Event dispatch (dispatch thread)
// ============================================================================

void ChannelClient::dispatch_events() {
    for (;;) {
        std::pair<std::string, Json> event;
        {
            std::unique_lock<std::mutex> lock(events_mutex_);
            events_cv_.wait(lock, [this]() { return dispatch_stop_ || !events_.empty(); });
            if (events_.empty()) return;
            event = events_.front();
            events_.pop_front();
        }

        EventSink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = event_sink_;
        }
        if (!sink) {
            LOG_DEBUG("[event] %s", event.first.c_str());
            continue;
        }
        try {
            sink(event.first, event.second);
        } catch (const std::exception& e) {
            LOG_WARN("[channel] event sink failed on %s: %s", event.first.c_str(), e.what());
        }
    }
}

void ChannelClient::on_closed(const std::string& reason) {
    fail_all(Outcome::DROPPED, reason);
}

// ============================================================================
// Teardown
// ============================================================================

void ChannelClient::fail_all(Outcome outcome, const std::string& reason) {
    size_t failed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = true;
            closed_reason_ = reason;
        }
        failed = pending_.size();
        for (std::map<int64_t, std::shared_ptr<PendingCall> >::iterator it = pending_.begin();
             it != pending_.end(); ++it) {
            it->second->outcome = outcome;
            it->second->reason = reason;
        }
        pending_.clear();
    }
    cv_.notify_all();

    if (failed > 0) {
        LOG_DEBUG("[channel] failed %zu pending call(s): %s", failed, reason.c_str());
    }
}

void ChannelClient::close() {
    fail_all(Outcome::CLOSED, "channel closed");
    transport_->close();
}

bool ChannelClient::is_open() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
    }
    return transport_->is_open();
}

void ChannelClient::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    event_sink_ = sink;
}

void ChannelClient::set_activity_hook(ActivityHook hook) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    activity_hook_ = hook;
}

size_t ChannelClient::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

int64_t ChannelClient::last_request_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

} // namespace tabwright
