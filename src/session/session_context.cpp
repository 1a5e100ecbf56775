#include <tabwright/session/session_context.hpp>

namespace tabwright {

SessionContext::SessionContext()
    : stopped_(false)
    , last_activity_(Clock::now()) {
}

void SessionContext::stop() {
    StopHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_.exchange(true)) return;
        hook = stop_hook_;
    }
    cv_.notify_all();
    if (hook) hook();
}

void SessionContext::set_stop_hook(StopHook hook) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_.load()) {
            stop_hook_ = hook;
            return;
        }
    }
    if (hook) hook();
}

void SessionContext::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = Clock::now();
}

SessionContext::Clock::time_point SessionContext::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

bool SessionContext::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_.load()) return false;
    if (duration.count() <= 0) return true;
    
    Clock::time_point until = Clock::now() + duration;
    cv_.wait_until(lock, until, [this]() { return stopped_.load(); });
    return !stopped_.load();
}

} // namespace tabwright
