/*
 * tabwright - Background session maintenance implementation
 */
#include <tabwright/session/supervisor.hpp>
#include <tabwright/cdp/commands.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>

#include <cmath>
#include <memory>

namespace tabwright {

// ============================================================================
// ScrollDelaySampler
// ============================================================================

ScrollDelaySampler::ScrollDelaySampler(const ScrollConfig& config)
    : rng_(std::random_device()())
    , mean_(config.mean_ms)
    , stddev_(config.stddev_ms)
    , min_(config.min_ms)
    , max_(config.max_ms) {
    validate();
}

ScrollDelaySampler::ScrollDelaySampler(const ScrollConfig& config, unsigned int seed)
    : rng_(seed)
    , mean_(config.mean_ms)
    , stddev_(config.stddev_ms)
    , min_(config.min_ms)
    , max_(config.max_ms) {
    validate();
}

void ScrollDelaySampler::validate() const {
    if (min_ < 0 || max_ < 0) {
        throw ConfigError("scroll delay bounds must not be negative");
    }
    if (min_ > max_) {
        throw ConfigError("scroll.min_ms must not exceed scroll.max_ms");
    }
}

double ScrollDelaySampler::next_ms() {
    if (stddev_ <= 0) {
        return clamp(mean_, min_, max_);
    }

    std::normal_distribution<double> dist(mean_, stddev_);
    for (int i = 0; i < kMaxRejections; ++i) {
        double sample = dist(rng_);
        if (sample >= min_ && sample <= max_) {
            return sample;
        }
    }

    std::uniform_real_distribution<double> fallback(min_, max_);
    return clamp(fallback(rng_), min_, max_);
}

std::chrono::milliseconds ScrollDelaySampler::next() {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(next_ms())));
}

// ============================================================================
// Routines
// ============================================================================

namespace {

// Whole seconds, as in "120s without responses"
std::string idle_duration_text(int ms) {
    if (ms >= 1000) return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

} // anonymous namespace

StepResult enforce_active_state(CommandSender& sender) {
    Command steps[3] = {
        commands::set_focus_emulation(true),
        commands::set_lifecycle_state("active"),
        commands::set_idle_override(true, true)
    };

    for (size_t i = 0; i < 3; ++i) {
        try {
            sender.call(steps[i].method, steps[i].params);
        } catch (const ChannelError& e) {
            return StepResult::fail(steps[i].method + ": " + e.what());
        }
    }
    return StepResult::ok();
}

int run_scroll_routine(CommandSender& sender, SessionContext& session,
                       const ScrollConfig& config, DelayProvider next_delay) {
    Command scroll = commands::scroll_by(0, config.offset_y);
    int sent = 0;

    while (!session.stopped()) {
        if (!session.sleep_for(next_delay())) {
            break;
        }
        try {
            sender.call(scroll.method, scroll.params);
            ++sent;
        } catch (const ChannelError& e) {
            LOG_WARN("[scroll] Auto-scroll error: %s", e.what());
            break;
        }
    }

    LOG_DEBUG("[scroll] routine exited after %d command(s)", sent);
    return sent;
}

int run_focus_routine(CommandSender& sender, SessionContext& session,
                      const FocusConfig& config) {
    Command activate = commands::activate_target(config.target_id);
    Command front = commands::bring_to_front();
    int cycles = 0;

    while (!session.stopped()) {
        try {
            sender.call(activate.method, activate.params);
            sender.call(front.method, front.params);
        } catch (const ChannelError& e) {
            LOG_WARN("[focus] Keep-focus error: %s", e.what());
            break;
        }

        StepResult active = enforce_active_state(sender);
        if (!active.success) {
            LOG_WARN("[focus] Active-state enforcement error: %s", active.error.c_str());
            break;
        }
        ++cycles;

        if (!session.sleep_for(std::chrono::milliseconds(config.interval_ms))) {
            break;
        }
    }

    LOG_DEBUG("[focus] routine exited after %d cycle(s)", cycles);
    return cycles;
}

bool run_idle_watchdog(SessionContext& session, const WatchdogConfig& config,
                       ActivitySource last_activity, CloseFunction close,
                       TimeoutCallback on_timeout) {
    const std::chrono::milliseconds timeout(config.idle_timeout_ms);

    while (!session.stopped()) {
        if (!session.sleep_for(std::chrono::milliseconds(config.check_interval_ms))) {
            break;
        }

        SessionContext::Clock::duration idle = SessionContext::Clock::now() - last_activity();
        if (idle < timeout) {
            continue;
        }

        std::string reason = idle_duration_text(config.idle_timeout_ms) +
                             " without " + config.description;
        if (on_timeout) {
            try {
                on_timeout(reason);
            } catch (const std::exception& e) {
                LOG_WARN("[watchdog] timeout callback failed: %s", e.what());
            }
        }
        LOG_WARN("[watchdog] Stopping: %s.", reason.c_str());
        session.stop();

        if (close) {
            try {
                close();
            } catch (const std::exception& e) {
                LOG_DEBUG("[watchdog] close after idle timeout failed: %s", e.what());
            }
        }
        return true;
    }
    return false;
}

// ============================================================================
// BackgroundTaskSupervisor
// ============================================================================

BackgroundTaskSupervisor::BackgroundTaskSupervisor(CommandSender& sender,
                                                   SessionContext& session,
                                                   const Config& config)
    : sender_(sender)
    , session_(session)
    , config_(config)
    , running_(0)
    , scroll_commands_(0)
    , focus_cycles_(0)
    , watchdog_fired_(false) {
}

BackgroundTaskSupervisor::~BackgroundTaskSupervisor() {
    stop();
}

void BackgroundTaskSupervisor::launch(const std::string& name, std::function<void()> body) {
    running_.fetch_add(1);
    std::lock_guard<std::mutex> lock(threads_mutex_);
    threads_.push_back(std::thread([this, name, body]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_ERROR("[%s] routine failed: %s", name.c_str(), e.what());
        }
        running_.fetch_sub(1);
    }));
}

void BackgroundTaskSupervisor::start() {
    if (config_.scroll.enabled) {
        DelayProvider delays = delay_provider_;
        if (!delays) {
            // Validates bounds up front so a bad config fails start(), not the thread
            std::shared_ptr<ScrollDelaySampler> sampler(new ScrollDelaySampler(config_.scroll));
            delays = [sampler]() { return sampler->next(); };
        }
        launch("scroll", [this, delays]() {
            scroll_commands_.store(run_scroll_routine(sender_, session_, config_.scroll, delays));
        });
    }

    if (config_.focus.enabled) {
        if (config_.focus.target_id.empty()) {
            LOG_WARN("[focus] no target id; focus routine not started");
        } else {
            launch("focus", [this]() {
                focus_cycles_.store(run_focus_routine(sender_, session_, config_.focus));
            });
        }
    }

    if (config_.watchdog.enabled) {
        ActivitySource source = activity_source_;
        if (!source) {
            SessionContext* session = &session_;
            source = [session]() { return session->last_activity(); };
        }
        launch("watchdog", [this, source]() {
            watchdog_fired_.store(run_idle_watchdog(session_, config_.watchdog, source,
                                                    close_, on_timeout_));
        });
    }

    LOG_INFO("Background routines started (scroll=%s, focus=%s, watchdog=%s)",
             config_.scroll.enabled ? "on" : "off",
             config_.focus.enabled ? "on" : "off",
             config_.watchdog.enabled ? "on" : "off");
}

void BackgroundTaskSupervisor::stop() {
    session_.stop();
    join();
}

void BackgroundTaskSupervisor::join() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        threads.swap(threads_);
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        if (threads[i].joinable()) {
            threads[i].join();
        }
    }
}

BackgroundTaskSupervisor::Stats BackgroundTaskSupervisor::get_stats() const {
    Stats stats;
    stats.scroll_commands = scroll_commands_.load();
    stats.focus_cycles = focus_cycles_.load();
    stats.watchdog_fired = watchdog_fired_.load();
    return stats;
}

} // namespace tabwright
