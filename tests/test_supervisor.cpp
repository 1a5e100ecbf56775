#include "test_framework.hpp"
#include "test_doubles.hpp"

#include <tabwright/cdp/channel_client.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/session/session_context.hpp>
#include <tabwright/session/supervisor.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {

using tabwright::Json;
using tabwright::SessionContext;
using tabwright::tests::StubSender;

typedef std::chrono::steady_clock Clock;

long long ms_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

tabwright::DelayProvider fixed_delay(int ms) {
    return [ms]() { return std::chrono::milliseconds(ms); };
}

// Throws ProtocolError for `failing_method` once `after` calls to it went through
StubSender::Handler fail_method(const std::string& failing_method, int after) {
    std::shared_ptr<std::atomic<int> > seen = std::make_shared<std::atomic<int> >(0);
    return [failing_method, after, seen](const std::string& method, const Json&) -> Json {
        if (method == failing_method && seen->fetch_add(1) >= after) {
            Json error = Json::object();
            error["code"] = -32000;
            error["message"] = "Target closed";
            throw tabwright::ProtocolError(method, error);
        }
        return Json::object();
    };
}

} // namespace

void register_supervisor_tests(std::vector<tabwright::tests::TestCase>& tests) {
    using tabwright::tests::require;
    using tabwright::tests::require_throws;

    // =====================================================================
    // Scroll delay sampler
    // =====================================================================

    tests.push_back({"sampler_stays_within_bounds", [] {
        struct Case { int mean, stddev, min, max; };
        const Case cases[] = {
            { 500, 150, 200, 5000 },     // defaults
            { 50, 10, 200, 5000 },       // mean far below the window
            { 90000, 5, 200, 5000 },     // mean far above the window
            { 500, 0, 200, 400 },        // no spread, mean outside
            { 300, 1000, 300, 300 },     // degenerate window
            { 1000, 100000, 0, 10 }      // huge spread
        };

        for (size_t c = 0; c < sizeof(cases) / sizeof(cases[0]); ++c) {
            tabwright::ScrollConfig config;
            config.mean_ms = cases[c].mean;
            config.stddev_ms = cases[c].stddev;
            config.min_ms = cases[c].min;
            config.max_ms = cases[c].max;

            tabwright::ScrollDelaySampler sampler(config, 42 + static_cast<unsigned int>(c));
            for (int i = 0; i < 2000; ++i) {
                double v = sampler.next_ms();
                require(v >= config.min_ms && v <= config.max_ms,
                        "sample out of bounds for case " + std::to_string(c) + ": " + std::to_string(v));
                long long rounded = sampler.next().count();
                require(rounded >= config.min_ms && rounded <= config.max_ms,
                        "rounded sample out of bounds for case " + std::to_string(c));
            }
        }
    }});

    tests.push_back({"sampler_rejects_inverted_bounds", [] {
        tabwright::ScrollConfig config;
        config.min_ms = 600;
        config.max_ms = 100;
        require_throws<tabwright::ConfigError>([&config]() { tabwright::ScrollDelaySampler s(config); },
                                               "min > max should be a ConfigError");
    }});

    // =====================================================================
    // Idle watchdog
    // =====================================================================

    tests.push_back({"watchdog_fires_once_after_idle_timeout", [] {
        SessionContext session;
        tabwright::WatchdogConfig config;
        config.idle_timeout_ms = 80;
        config.check_interval_ms = 10;

        Clock::time_point last = Clock::now();
        std::atomic<int> closes(0);
        std::vector<std::string> reasons;

        Clock::time_point started = Clock::now();
        bool fired = tabwright::run_idle_watchdog(
            session, config,
            [last]() { return last; },
            [&closes]() { closes.fetch_add(1); },
            [&reasons](const std::string& reason) { reasons.push_back(reason); });
        long long waited = ms_since(started);

        require(fired, "watchdog should report firing");
        require(waited >= 80, "watchdog fired early: " + std::to_string(waited) + "ms");
        require(reasons.size() == 1, "callback should run exactly once");
        require(reasons[0] == "80ms without responses", "unexpected reason: " + reasons[0]);
        require(closes.load() == 1, "close should be attempted once");
        require(session.stopped(), "stop flag should be set");
    }});

    tests.push_back({"watchdog_reason_uses_whole_seconds", [] {
        SessionContext session;
        tabwright::WatchdogConfig config;
        config.idle_timeout_ms = 120000;
        config.check_interval_ms = 5;

        // Last activity two minutes and a bit ago
        Clock::time_point last = Clock::now() - std::chrono::milliseconds(121000);
        std::string reason;
        require(tabwright::run_idle_watchdog(session, config, [last]() { return last; },
                                             tabwright::CloseFunction(),
                                             [&reason](const std::string& r) { reason = r; }),
                "watchdog should fire");
        require(reason == "120s without responses", "unexpected reason: " + reason);
    }});

    tests.push_back({"watchdog_never_fires_while_active", [] {
        SessionContext session;
        tabwright::WatchdogConfig config;
        config.idle_timeout_ms = 50;
        config.check_interval_ms = 5;

        std::atomic<int> callbacks(0);
        bool fired = true;
        std::thread watchdog([&]() {
            fired = tabwright::run_idle_watchdog(
                session, config,
                []() { return Clock::now(); },
                []() {},
                [&callbacks](const std::string&) { callbacks.fetch_add(1); });
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        session.stop();
        watchdog.join();

        require(!fired, "watchdog must not fire while activity is fresh");
        require(callbacks.load() == 0, "callback must not run");
    }});

    tests.push_back({"watchdog_stops_session_even_if_close_throws", [] {
        SessionContext session;
        tabwright::WatchdogConfig config;
        config.idle_timeout_ms = 20;
        config.check_interval_ms = 5;

        Clock::time_point last = Clock::now();
        bool fired = tabwright::run_idle_watchdog(
            session, config, [last]() { return last; },
            []() { throw tabwright::TransportError("already gone"); },
            [](const std::string&) { throw std::runtime_error("callback failure"); });

        require(fired, "watchdog should still report firing");
        require(session.stopped(), "stop flag should be set despite close failing");
    }});

    tests.push_back({"watchdog_uses_session_activity", [] {
        SessionContext session;
        tabwright::WatchdogConfig config;
        config.idle_timeout_ms = 60;
        config.check_interval_ms = 5;

        std::atomic<bool> keep_touching(true);
        std::thread toucher([&]() {
            while (keep_touching.load()) {
                session.touch();
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        });

        bool fired = false;
        Clock::time_point started = Clock::now();
        std::thread watchdog([&]() {
            SessionContext* s = &session;
            fired = tabwright::run_idle_watchdog(session, config,
                                                 [s]() { return s->last_activity(); },
                                                 tabwright::CloseFunction(),
                                                 tabwright::TimeoutCallback());
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        keep_touching.store(false);
        toucher.join();
        watchdog.join();

        require(fired, "watchdog should fire once touches stop");
        require(ms_since(started) >= 150, "watchdog fired while activity was fresh");
    }});

    // =====================================================================
    // Scroll / focus routines
    // =====================================================================

    tests.push_back({"scroll_routine_sends_fixed_scroll_until_stopped", [] {
        SessionContext session;
        StubSender sender;
        tabwright::ScrollConfig config;

        int sent = 0;
        std::thread routine([&]() {
            sent = tabwright::run_scroll_routine(sender, session, config, fixed_delay(5));
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        session.stop();
        routine.join();

        require(sent > 0, "some scroll commands should have been sent");
        std::vector<tabwright::tests::SentCommand> calls = sender.sent();
        require(static_cast<int>(calls.size()) == sent, "return value should count commands");
        require(calls[0].method == "Runtime.evaluate", "scroll goes through Runtime.evaluate");
        require(calls[0].params["expression"] == "window.scrollBy(0, 40);", "fixed scroll expression expected");
        require(calls[0].params["returnByValue"] == false, "scroll does not need a value back");
    }});

    tests.push_back({"scroll_routine_failure_ends_only_that_routine", [] {
        SessionContext session;
        StubSender sender(fail_method("Runtime.evaluate", 2));
        tabwright::ScrollConfig config;

        int sent = tabwright::run_scroll_routine(sender, session, config, fixed_delay(1));
        require(sent == 2, "routine should stop at the first failure");
        require(!session.stopped(), "a scroll failure must not stop the session");
    }});

    tests.push_back({"focus_routine_sends_activation_sequence", [] {
        SessionContext session;
        StubSender sender;
        tabwright::FocusConfig config;
        config.target_id = "TAB-1";
        config.interval_ms = 10;

        int cycles = 0;
        std::thread routine([&]() {
            cycles = tabwright::run_focus_routine(sender, session, config);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        session.stop();
        routine.join();

        require(cycles >= 1, "at least one cycle expected");
        std::vector<tabwright::tests::SentCommand> calls = sender.sent();
        require(calls.size() >= 5, "a full cycle is five commands");
        require(calls[0].method == "Target.activateTarget" && calls[0].params["targetId"] == "TAB-1",
                "cycle starts by activating the target");
        require(calls[1].method == "Page.bringToFront", "then bring to front");
        require(calls[2].method == "Emulation.setFocusEmulationEnabled" &&
                calls[2].params["enabled"] == true, "then focus emulation");
        require(calls[3].method == "Page.setWebLifecycleState" &&
                calls[3].params["state"] == "active", "then lifecycle state");
        require(calls[4].method == "Emulation.setIdleOverride" &&
                calls[4].params["isUserActive"] == true &&
                calls[4].params["isScreenUnlocked"] == true, "then idle override");
    }});

    tests.push_back({"focus_routine_stops_when_enforcement_fails", [] {
        SessionContext session;
        StubSender sender(fail_method("Page.setWebLifecycleState", 0));
        tabwright::FocusConfig config;
        config.target_id = "TAB-1";
        config.interval_ms = 5;

        int cycles = tabwright::run_focus_routine(sender, session, config);
        require(cycles == 0, "no cycle should complete");
        require(sender.count("Emulation.setIdleOverride") == 0, "sequence stops at the failing step");
        require(!session.stopped(), "a focus failure must not stop the session");
    }});

    tests.push_back({"enforce_active_state_reports_failing_step", [] {
        StubSender ok_sender;
        require(tabwright::enforce_active_state(ok_sender).success, "all three steps should succeed");
        require(ok_sender.sent().size() == 3, "three sub-commands expected");

        StubSender failing(fail_method("Emulation.setFocusEmulationEnabled", 0));
        tabwright::StepResult result = tabwright::enforce_active_state(failing);
        require(!result.success, "failure should be reported");
        require(result.error.find("Emulation.setFocusEmulationEnabled") != std::string::npos,
                "error should name the step: " + result.error);
        require(failing.sent().size() == 1, "later steps must not run");
    }});

    // =====================================================================
    // Session context
    // =====================================================================

    tests.push_back({"session_stop_hook_runs_once", [] {
        SessionContext session;
        std::atomic<int> calls(0);
        session.set_stop_hook([&calls]() { calls.fetch_add(1); });

        require(session.sleep_for(std::chrono::milliseconds(0)), "running session sleeps normally");
        session.stop();
        session.stop();
        require(calls.load() == 1, "hook should run exactly once");
        require(!session.sleep_for(std::chrono::milliseconds(50)), "stopped session should not sleep");

        std::atomic<int> late(0);
        session.set_stop_hook([&late]() { late.fetch_add(1); });
        require(late.load() == 1, "hook set after stop should run at once");
    }});

    tests.push_back({"supervisor_stop_releases_routines_blocked_on_channel", [] {
        SessionContext session;
        tabwright::tests::FakeTransport* fake = new tabwright::tests::FakeTransport();
        tabwright::ChannelClient channel((std::unique_ptr<tabwright::Transport>(fake)));
        session.set_stop_hook([&channel]() { channel.close(); });

        tabwright::BackgroundTaskSupervisor::Config config;
        config.focus.target_id = "TAB-1";
        config.focus.interval_ms = 5;
        config.watchdog.enabled = false;

        tabwright::BackgroundTaskSupervisor supervisor(channel, session, config);
        supervisor.set_delay_provider(fixed_delay(1));
        supervisor.start();

        // Scroll and focus both end up waiting on calls the page never answers
        require(fake->wait_for_outbound(2, 2000), "both routines should have a call in flight");

        std::atomic<bool> joined(false);
        std::thread stopper([&supervisor, &joined]() {
            supervisor.stop();
            joined.store(true);
        });
        bool released = tabwright::tests::wait_until([&joined]() { return joined.load(); }, 2000);
        if (!released) channel.close();
        stopper.join();

        require(released, "stop should not hang on calls still waiting for the page");
        require(supervisor.running() == 0, "every routine should have ended");
        require(channel.pending_count() == 0, "nothing should stay pending");
    }});

    // =====================================================================
    // Supervisor
    // =====================================================================

    tests.push_back({"supervisor_isolates_routine_failures", [] {
        SessionContext session;
        StubSender sender(fail_method("Runtime.evaluate", 0));

        tabwright::BackgroundTaskSupervisor::Config config;
        config.focus.target_id = "TAB-1";
        config.focus.interval_ms = 5;
        config.watchdog.enabled = false;

        tabwright::BackgroundTaskSupervisor supervisor(sender, session, config);
        supervisor.set_delay_provider(fixed_delay(1));
        supervisor.start();

        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        require(!session.stopped(), "scroll failure must not stop the session");
        require(supervisor.running() == 1, "focus routine should still be running");

        supervisor.stop();
        tabwright::BackgroundTaskSupervisor::Stats stats = supervisor.get_stats();
        require(stats.scroll_commands == 0, "no scroll should have succeeded");
        require(stats.focus_cycles >= 2, "focus should keep cycling");
        require(supervisor.running() == 0, "every routine should have ended");
    }});

    tests.push_back({"supervisor_watchdog_closes_and_stops_all", [] {
        SessionContext session;
        StubSender sender;

        tabwright::BackgroundTaskSupervisor::Config config;
        config.focus.target_id = "TAB-1";
        config.focus.interval_ms = 5;
        config.watchdog.idle_timeout_ms = 40;
        config.watchdog.check_interval_ms = 5;

        Clock::time_point frozen = Clock::now();
        std::atomic<int> closes(0);
        std::string reason;

        tabwright::BackgroundTaskSupervisor supervisor(sender, session, config);
        supervisor.set_delay_provider(fixed_delay(2));
        supervisor.set_activity_source([frozen]() { return frozen; });
        supervisor.set_close_function([&closes]() { closes.fetch_add(1); });
        supervisor.set_timeout_callback([&reason](const std::string& r) { reason = r; });
        supervisor.start();
        supervisor.join();

        require(session.stopped(), "watchdog should stop the session");
        require(closes.load() == 1, "close should be attempted once");
        require(reason == "40ms without responses", "unexpected reason: " + reason);
        require(supervisor.get_stats().watchdog_fired, "stats should record the firing");
        require(supervisor.running() == 0, "every routine should have ended");
    }});

    tests.push_back({"supervisor_skips_focus_without_target", [] {
        SessionContext session;
        StubSender sender;

        tabwright::BackgroundTaskSupervisor::Config config;
        config.scroll.enabled = false;
        config.watchdog.enabled = false;

        tabwright::BackgroundTaskSupervisor supervisor(sender, session, config);
        supervisor.start();
        require(supervisor.running() == 0, "nothing should be running");
        supervisor.stop();
        require(sender.sent().empty(), "no command expected");
    }});
}
