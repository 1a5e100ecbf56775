/*
 * tabwright - Background session maintenance
 *
 * Keeps the remote tab looking "in use" while an extraction runs and ends
 * the session when the browser goes quiet.
 *
 * Routines (each on its own thread, each isolating its own failures):
 * - scroll: random pauses from a truncated normal distribution, then a
 *   fixed scroll command
 * - focus: activate target, bring to front, enforce active state
 * - idle watchdog: stops the session and closes the channel after a
 *   period without activity
 */
#ifndef TABWRIGHT_SESSION_SUPERVISOR_HPP
#define TABWRIGHT_SESSION_SUPERVISOR_HPP

#include <tabwright/cdp/command_sender.hpp>
#include <tabwright/core/types.hpp>
#include <tabwright/session/session_context.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace tabwright {

// ============================================================================
// Routine configuration
// ============================================================================

struct ScrollConfig {
    bool enabled;
    int mean_ms;
    int stddev_ms;
    int min_ms;
    int max_ms;
    int offset_y;                  // pixels per scroll command

    ScrollConfig()
        : enabled(true)
        , mean_ms(500)
        , stddev_ms(150)
        , min_ms(200)
        , max_ms(5000)
        , offset_y(40)
    {}
};

struct FocusConfig {
    bool enabled;
    std::string target_id;
    int interval_ms;

    FocusConfig()
        : enabled(true)
        , interval_ms(2000)
    {}
};

struct WatchdogConfig {
    bool enabled;
    int idle_timeout_ms;
    int check_interval_ms;
    std::string description;       // what went missing, for the reason text

    WatchdogConfig()
        : enabled(true)
        , idle_timeout_ms(120000)
        , check_interval_ms(5000)
        , description("responses")
    {}
};

// ============================================================================
// Scroll delay sampler
// ============================================================================

// Normal(mean, stddev) truncated to [min_ms, max_ms] by resampling. After
// kMaxRejections misses it draws uniformly inside the bounds instead, so a
// mean far outside the window still terminates.
class ScrollDelaySampler {
public:
    static const int kMaxRejections = 100;

    // Throws ConfigError if min_ms > max_ms or either is negative
    explicit ScrollDelaySampler(const ScrollConfig& config);
    ScrollDelaySampler(const ScrollConfig& config, unsigned int seed);

    double next_ms();
    std::chrono::milliseconds next();

private:
    void validate() const;

    std::mt19937 rng_;
    double mean_;
    double stddev_;
    double min_;
    double max_;
};

// ============================================================================
// Routines
// ============================================================================

typedef std::function<std::chrono::milliseconds()> DelayProvider;
typedef std::function<SessionContext::Clock::time_point()> ActivitySource;
typedef std::function<void()> CloseFunction;
typedef std::function<void(const std::string& reason)> TimeoutCallback;

// Focus emulation on, lifecycle "active", idle detection overridden.
// Stops at the first failing sub-command.
StepResult enforce_active_state(CommandSender& sender);

// Each returns when the session stops or its own command fails.
// Return value: commands issued (scroll) / cycles completed (focus).
int run_scroll_routine(CommandSender& sender, SessionContext& session,
                       const ScrollConfig& config, DelayProvider next_delay);

int run_focus_routine(CommandSender& sender, SessionContext& session,
                      const FocusConfig& config);

// Returns true if the idle timeout fired. close may throw; it is logged.
bool run_idle_watchdog(SessionContext& session, const WatchdogConfig& config,
                       ActivitySource last_activity, CloseFunction close,
                       TimeoutCallback on_timeout);

// ============================================================================
// Supervisor
// ============================================================================

class BackgroundTaskSupervisor {
public:
    struct Config {
        ScrollConfig scroll;
        FocusConfig focus;
        WatchdogConfig watchdog;
    };

    struct Stats {
        int scroll_commands;
        int focus_cycles;
        bool watchdog_fired;
    };

    BackgroundTaskSupervisor(CommandSender& sender, SessionContext& session,
                             const Config& config);
    ~BackgroundTaskSupervisor();

    // Optional wiring; set before start()
    void set_activity_source(ActivitySource source) { activity_source_ = source; }
    void set_close_function(CloseFunction close) { close_ = close; }
    void set_timeout_callback(TimeoutCallback cb) { on_timeout_ = cb; }
    void set_delay_provider(DelayProvider provider) { delay_provider_ = provider; }

    void start();

    // Sets the stop flag and waits for every routine
    void stop();

    // Waits without stopping (routines end on their own or via the flag)
    void join();

    int running() const { return running_.load(); }
    Stats get_stats() const;

private:
    BackgroundTaskSupervisor(const BackgroundTaskSupervisor&);
    BackgroundTaskSupervisor& operator=(const BackgroundTaskSupervisor&);

    void launch(const std::string& name, std::function<void()> body);

    CommandSender& sender_;
    SessionContext& session_;
    Config config_;

    ActivitySource activity_source_;
    CloseFunction close_;
    TimeoutCallback on_timeout_;
    DelayProvider delay_provider_;

    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
    std::atomic<int> running_;
    std::atomic<int> scroll_commands_;
    std::atomic<int> focus_cycles_;
    std::atomic<bool> watchdog_fired_;
};

} // namespace tabwright

#endif // TABWRIGHT_SESSION_SUPERVISOR_HPP
