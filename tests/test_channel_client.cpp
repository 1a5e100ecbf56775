#include "test_framework.hpp"
#include "test_doubles.hpp"

#include <tabwright/cdp/channel_client.hpp>
#include <tabwright/core/errors.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace {

using tabwright::Json;
using tabwright::tests::FakeTransport;

// Client over a FakeTransport; `fake` stays owned by the client
std::unique_ptr<tabwright::ChannelClient> make_client(FakeTransport*& fake) {
    fake = new FakeTransport();
    std::unique_ptr<tabwright::Transport> transport(fake);
    return std::unique_ptr<tabwright::ChannelClient>(
        new tabwright::ChannelClient(std::move(transport)));
}

// Answers every request with {"echo": method, "params": params}
std::vector<std::string> echo(const Json& request) {
    Json result = Json::object();
    result["echo"] = request["method"];
    result["params"] = request.contains("params") ? request["params"] : Json::object();
    std::vector<std::string> replies;
    replies.push_back(tabwright::tests::result_frame(request["id"].get<int64_t>(), result));
    return replies;
}

} // namespace

void register_channel_tests(std::vector<tabwright::tests::TestCase>& tests) {
    using tabwright::tests::require;
    using tabwright::tests::require_throws;
    using tabwright::tests::TestCase;

    tests.push_back({"channel_call_returns_matching_result", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        require(fake->started(), "client should start the transport");
        fake->set_responder(echo);

        Json result = client->call("Browser.getVersion");
        require(result["echo"] == "Browser.getVersion", "result should come from the matching response");

        std::vector<std::string> sent = fake->outbound();
        require(sent.size() == 1, "one frame expected");
        Json frame = Json::parse(sent[0]);
        require(frame["id"] == 1, "first request id should be 1");
        require(!frame.contains("params"), "empty params should be omitted");
        client->close();
    }});

    tests.push_back({"channel_ids_increase_and_params_are_sent", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        fake->set_responder(echo);

        Json params = Json::object();
        params["url"] = "https://example.com/";
        client->call("Page.enable");
        Json result = client->call("Page.navigate", params);
        require(result["params"]["url"] == "https://example.com/", "params should reach the wire");

        std::vector<std::string> sent = fake->outbound();
        require(sent.size() == 2, "two frames expected");
        require(Json::parse(sent[1])["id"] == 2, "ids should increase");
        require(client->last_request_id() == 2, "last_request_id mismatch");
        require(client->pending_count() == 0, "nothing should stay pending");
    }});

    tests.push_back({"channel_out_of_order_responses_resolve_by_id", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);

        std::vector<std::string> events;
        std::mutex events_mutex;
        client->set_event_sink([&](const std::string& method, const Json&) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(method);
        });

        const int kCalls = 24;
        std::atomic<int> mismatches(0);
        std::atomic<int> errors(0);
        std::vector<std::thread> callers;
        for (int i = 0; i < kCalls; ++i) {
            callers.push_back(std::thread([&client, &mismatches, &errors, i]() {
                Json params = Json::object();
                params["n"] = i;
                try {
                    Json result = client->call("Test.echo", params);
                    if (result["n"] != i) mismatches.fetch_add(1);
                } catch (const std::exception&) {
                    errors.fetch_add(1);
                }
            }));
        }

        require(fake->wait_for_outbound(kCalls, 2000), "all requests should be written");

        std::vector<std::string> sent = fake->outbound();
        std::mt19937 rng(1234);
        std::shuffle(sent.begin(), sent.end(), rng);
        for (size_t i = 0; i < sent.size(); ++i) {
            Json request = Json::parse(sent[i]);
            Json result = Json::object();
            result["n"] = request["params"]["n"];
            fake->deliver(tabwright::tests::result_frame(request["id"].get<int64_t>(), result));
            if (i % 3 == 0) {
                fake->deliver(tabwright::tests::event_frame("Page.frameNavigated", Json::object()));
            }
        }

        for (size_t i = 0; i < callers.size(); ++i) callers[i].join();
        size_t still_pending = client->pending_count();
        require(errors.load() == 0, "no call should fail");
        require(mismatches.load() == 0, "each caller must get its own response");
        require(still_pending == 0, "pending table should be empty");
        bool all_events = tabwright::tests::wait_until([&events, &events_mutex]() {
            std::lock_guard<std::mutex> lock(events_mutex);
            return events.size() == (kCalls + 2) / 3;
        }, 2000);
        client.reset();
        require(all_events, "interleaved events should reach the sink");
    }});

    tests.push_back({"channel_close_fails_every_pending_call", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);

        const int kPending = 5;
        std::atomic<int> closed_errors(0);
        std::atomic<int> other(0);
        std::vector<std::thread> callers;
        for (int i = 0; i < kPending; ++i) {
            callers.push_back(std::thread([&client, &closed_errors, &other]() {
                try {
                    client->call("Runtime.evaluate");
                    other.fetch_add(1);
                } catch (const tabwright::ChannelClosed&) {
                    closed_errors.fetch_add(1);
                } catch (const std::exception&) {
                    other.fetch_add(1);
                }
            }));
        }

        require(fake->wait_for_outbound(kPending, 2000), "requests should be written");
        client->close();
        for (size_t i = 0; i < callers.size(); ++i) callers[i].join();

        require(closed_errors.load() == kPending, "every waiter should get ChannelClosed");
        require(other.load() == 0, "no waiter should see another outcome");
        require(client->pending_count() == 0, "pending table should be empty");
        require(!client->is_open(), "client should report closed");

        require_throws<tabwright::ChannelClosed>([&client]() { client->call("Page.enable"); },
                                                 "calls after close should fail immediately");
        client->close();
    }});

    tests.push_back({"channel_remote_error_reaches_only_its_caller", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        fake->set_responder([](const Json& request) {
            std::vector<std::string> replies;
            int64_t id = request["id"].get<int64_t>();
            if (request["method"] == "DOM.focus") {
                replies.push_back(tabwright::tests::error_frame(id, -32000, "No node with given id"));
            } else {
                replies.push_back(tabwright::tests::result_frame(id, Json::object()));
            }
            return replies;
        });

        try {
            client->call("DOM.focus");
            require(false, "ProtocolError expected");
        } catch (const tabwright::ProtocolError& e) {
            require(e.method() == "DOM.focus", "method should be recorded");
            require(e.code() == -32000, "remote code should be kept");
            require(e.remote_message() == "No node with given id", "remote message should be kept");
        }

        client->call("Page.enable");
        require(client->is_open(), "a remote error must not close the channel");
    }});

    tests.push_back({"channel_events_reach_sink_in_arrival_order", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);

        std::vector<std::string> seen;
        std::mutex seen_mutex;
        client->set_event_sink([&seen, &seen_mutex](const std::string& method, const Json& params) {
            {
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen.push_back(method + ":" + params.value("n", std::string()));
            }
            if (method == "Boom.event") throw std::runtime_error("sink failure");
        });

        const char* names[] = { "First.event", "Boom.event", "Second.event", "Third.event" };
        for (size_t i = 0; i < 4; ++i) {
            Json params = Json::object();
            params["n"] = std::to_string(i);
            fake->deliver(tabwright::tests::event_frame(names[i], params));
        }

        bool delivered = tabwright::tests::wait_until([&seen, &seen_mutex]() {
            std::lock_guard<std::mutex> lock(seen_mutex);
            return seen.size() == 4;
        }, 2000);
        client.reset();
        require(delivered, "every event should reach the sink");
        require(seen[0] == "First.event:0" && seen[1] == "Boom.event:1" &&
                seen[2] == "Second.event:2" && seen[3] == "Third.event:3",
                "events should keep arrival order");
    }});

    tests.push_back({"channel_slow_event_sink_does_not_hold_responses", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        fake->set_responder(echo);

        std::mutex gate_mutex;
        std::condition_variable gate_cv;
        bool released = false;
        std::atomic<int> handled(0);
        client->set_event_sink([&](const std::string&, const Json&) {
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate_cv.wait(lock, [&released]() { return released; });
            handled.fetch_add(1);
        });

        fake->deliver(tabwright::tests::event_frame("Page.frameStoppedLoading", Json::object()));
        fake->deliver(tabwright::tests::event_frame("Page.loadEventFired", Json::object()));

        std::string answered;
        try {
            answered = client->call("Runtime.enable")["echo"].get<std::string>();
        } catch (const std::exception& e) {
            answered = e.what();
        }
        int handled_while_blocked = handled.load();

        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            released = true;
        }
        gate_cv.notify_all();
        bool drained = tabwright::tests::wait_until([&handled]() { return handled.load() == 2; }, 2000);
        client.reset();

        require(answered == "Runtime.enable", "response should arrive while the sink is busy: " + answered);
        require(handled_while_blocked == 0, "sink should still be blocked on the first event");
        require(drained, "queued events should be handed over once the sink returns");
    }});

    tests.push_back({"channel_remote_drop_fails_pending_with_transport_error", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);

        std::string failure;
        std::thread caller([&client, &failure]() {
            try {
                client->call("Runtime.evaluate");
            } catch (const tabwright::ChannelClosed&) {
                failure = "closed";
            } catch (const tabwright::TransportError&) {
                failure = "transport";
            }
        });

        require(fake->wait_for_outbound(1, 2000), "request should be written");
        fake->drop("connection reset");
        caller.join();

        require(failure == "transport", "a drop should surface as TransportError");
        require_throws<tabwright::ChannelClosed>([&client]() { client->call("Page.enable"); },
                                                 "calls after a drop should fail immediately");
    }});

    tests.push_back({"channel_write_failure_raises_transport_error", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        fake->set_fail_sends(true);

        require_throws<tabwright::TransportError>([&client]() { client->call("Page.enable"); },
                                                  "write failure should raise TransportError");
        require(client->pending_count() == 0, "failed request must not stay pending");
    }});

    tests.push_back({"channel_activity_hook_fires_per_response", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);
        fake->set_responder(echo);

        std::atomic<int> hits(0);
        client->set_activity_hook([&hits]() { hits.fetch_add(1); });

        client->call("Page.enable");
        client->call("Runtime.enable");
        fake->deliver(tabwright::tests::event_frame("Page.loadEventFired", Json::object()));
        require(hits.load() == 2, "hook should fire for responses only");
    }});

    tests.push_back({"channel_ignores_malformed_and_unknown_frames", [] {
        FakeTransport* fake = NULL;
        std::unique_ptr<tabwright::ChannelClient> client = make_client(fake);

        fake->deliver("not json at all");
        fake->deliver("[1, 2, 3]");
        fake->deliver("{\"id\": 999, \"result\": {}}");
        fake->deliver("{\"foo\": \"bar\"}");

        fake->set_responder(echo);
        Json result = client->call("Page.enable");
        require(result["echo"] == "Page.enable", "channel should keep working");
    }});

    tests.push_back({"channel_encode_request_omits_empty_params", [] {
        Json empty = Json::parse(tabwright::ChannelClient::encode_request(7, "Page.enable", Json::object()));
        require(empty["id"] == 7 && empty["method"] == "Page.enable", "id and method expected");
        require(!empty.contains("params"), "empty params should be omitted");

        Json params = Json::object();
        params["state"] = "active";
        Json full = Json::parse(tabwright::ChannelClient::encode_request(8, "Page.setWebLifecycleState", params));
        require(full["params"]["state"] == "active", "params should be kept");
    }});
}
