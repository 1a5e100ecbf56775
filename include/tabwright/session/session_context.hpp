#ifndef TABWRIGHT_SESSION_SESSION_CONTEXT_HPP
#define TABWRIGHT_SESSION_SESSION_CONTEXT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace tabwright {

// Lifecycle state shared by reference between the extractor and every
// background routine. Once stopped it stays stopped.
class SessionContext {
public:
    typedef std::chrono::steady_clock Clock;

    SessionContext();

    typedef std::function<void()> StopHook;

    // Idempotent; wakes every sleep_for() in progress and runs the stop hook
    // once, on the thread that stopped the session
    void stop();
    bool stopped() const { return stopped_.load(); }

    // Record a successful exchange with the browser
    void touch();
    Clock::time_point last_activity() const;

    // Waits up to `duration`. Returns false if the session is (or becomes)
    // stopped, true when the full duration elapsed.
    bool sleep_for(std::chrono::milliseconds duration);

    // Releases whatever a stopped session must not leave blocked (the
    // channel, so pending calls fail). Runs at once if already stopped.
    void set_stop_hook(StopHook hook);

private:
    SessionContext(const SessionContext&);
    SessionContext& operator=(const SessionContext&);

    std::atomic<bool> stopped_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Clock::time_point last_activity_;
    StopHook stop_hook_;
};

} // namespace tabwright

#endif // TABWRIGHT_SESSION_SESSION_CONTEXT_HPP
