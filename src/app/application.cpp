/*
 * tabwright - Application implementation
 */
#include <tabwright/app/application.hpp>
#include <tabwright/cdp/commands.hpp>
#include <tabwright/cdp/target_resolver.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <thread>
#include <curl/curl.h>

namespace tabwright {

constexpr const char* AppInfo::VERSION;
constexpr const char* AppInfo::NAME;
constexpr const char* AppInfo::DEFAULT_ENDPOINT;

// Global signal handler
static void signal_handler(int sig) {
    (void)sig;
    Application::instance().request_stop();
}

// ============================================================================
// Command line
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - keep a remote browser tab busy while reading items from it\n\n"
              << "Usage: " << prog << " [options] [search terms]\n\n"
              << "Options:\n"
              << "  --endpoint URL       Remote debugging HTTP endpoint (default "
              << AppInfo::DEFAULT_ENDPOINT << ")\n"
              << "  --target-id ID       Reuse this tab instead of the first page target\n"
              << "  --url URL            Navigate before extracting\n"
              << "  --query TEXT         Navigate to the image search for TEXT\n"
              << "  --start N            First item index (default 0)\n"
              << "  --count N            Number of items (default 10)\n"
              << "  --config FILE        JSON config file\n"
              << "  --list               Print the available targets and exit\n"
              << "  --notify MESSAGE     Flag the tab with MESSAGE and exit\n"
              << "  --no-scroll          Disable the scroll routine\n"
              << "  --no-focus           Disable the focus routine\n"
              << "  --no-hover           Skip hover refinement\n"
              << "  --idle-timeout MS    Stop after MS without responses\n"
              << "  --deadline MS        Per-item polling deadline\n"
              << "  --log-level LEVEL    debug, info, warn or error\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version\n\n"
              << "Records are written to stdout as one JSON object per line.\n"
              << "Exit status: 0 all records successful, 2 some unsuccessful, 1 fatal error.\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

std::string require_value(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string("missing value for ") + argv[i]);
    }
    return argv[++i];
}

int64_t require_number(int argc, char* argv[], int& i) {
    std::string flag = argv[i];
    std::string value = require_value(argc, argv, i);
    int64_t n = 0;
    if (!parse_int64(value, n) || n > 0x7fffffff) {
        throw ConfigError("invalid number for " + flag + ": '" + value + "'");
    }
    return n;
}

void print_record(const ExtractionRecord& record) {
    std::cout << record.to_json().dump() << std::endl;
}

} // anonymous namespace

std::string image_search_url(const std::string& query) {
    return "https://www.google.com/search?tbm=isch&q=" + url_encode_query(query);
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    std::string positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            cl.action = CommandLine::HELP;
            return cl;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            cl.action = CommandLine::VERSION;
            return cl;
        }

        if (strcmp(arg, "--endpoint") == 0) {
            cl.overrides["endpoint"] = require_value(argc, argv, i);
        } else if (strcmp(arg, "--target-id") == 0) {
            cl.overrides["target_id"] = require_value(argc, argv, i);
        } else if (strcmp(arg, "--url") == 0) {
            cl.overrides["url"] = require_value(argc, argv, i);
        } else if (strcmp(arg, "--query") == 0) {
            cl.overrides["url"] = image_search_url(require_value(argc, argv, i));
        } else if (strcmp(arg, "--start") == 0) {
            cl.overrides["extract.start"] = require_number(argc, argv, i);
        } else if (strcmp(arg, "--count") == 0) {
            cl.overrides["extract.count"] = require_number(argc, argv, i);
        } else if (strcmp(arg, "--config") == 0) {
            cl.config_path = require_value(argc, argv, i);
        } else if (strcmp(arg, "--list") == 0) {
            cl.action = CommandLine::LIST;
        } else if (strcmp(arg, "--notify") == 0) {
            cl.action = CommandLine::NOTIFY;
            cl.notify_message = require_value(argc, argv, i);
        } else if (strcmp(arg, "--no-scroll") == 0) {
            cl.overrides["scroll.enabled"] = false;
        } else if (strcmp(arg, "--no-focus") == 0) {
            cl.overrides["focus.enabled"] = false;
        } else if (strcmp(arg, "--no-hover") == 0) {
            cl.overrides["extract.hover"] = false;
        } else if (strcmp(arg, "--idle-timeout") == 0) {
            cl.overrides["watchdog.idle_timeout_ms"] = require_number(argc, argv, i);
        } else if (strcmp(arg, "--deadline") == 0) {
            cl.overrides["extract.deadline_ms"] = require_number(argc, argv, i);
        } else if (strcmp(arg, "--log-level") == 0) {
            cl.overrides["log_level"] = require_value(argc, argv, i);
        } else if (arg[0] == '-' && arg[1] != '\0') {
            throw ConfigError(std::string("unknown option ") + arg);
        } else {
            if (!positional.empty()) positional += " ";
            positional += arg;
        }
    }

    // Bare words are search terms, as with --query
    if (!positional.empty()) {
        if (cl.overrides.contains("url")) {
            throw ConfigError("search terms given together with --url/--query");
        }
        cl.overrides["url"] = image_search_url(positional);
    }
    return cl;
}

// ============================================================================
// Run settings
// ============================================================================

namespace {

int positive_int(const Config& config, const std::string& key, int def) {
    int64_t v = config.get_int(key, def);
    if (v <= 0 || v > 0x7fffffff) {
        throw ConfigError(key + " must be a positive number of milliseconds");
    }
    return static_cast<int>(v);
}

int non_negative_int(const Config& config, const std::string& key, int def) {
    int64_t v = config.get_int(key, def);
    if (v < 0 || v > 0x7fffffff) {
        throw ConfigError(key + " must not be negative");
    }
    return static_cast<int>(v);
}

} // anonymous namespace

RunSettings RunSettings::from_config(const Config& config) {
    RunSettings s;

    s.endpoint = config.get_string("endpoint", AppInfo::DEFAULT_ENDPOINT);
    if (!starts_with(s.endpoint, "http://") && !starts_with(s.endpoint, "https://")) {
        throw ConfigError("endpoint must be an http:// or https:// address: '" + s.endpoint + "'");
    }
    s.target_id = config.get_string("target_id", "");
    s.url = config.get_string("url", "");
    s.start = non_negative_int(config, "extract.start", s.start);
    s.count = non_negative_int(config, "extract.count", s.count);
    if (static_cast<int64_t>(s.start) + s.count - 1 > 0x7fffffff) {
        throw ConfigError("extract.start + extract.count must stay within the index range");
    }

    ScrollConfig& scroll = s.supervisor.scroll;
    scroll.enabled = config.get_bool("scroll.enabled", scroll.enabled);
    scroll.mean_ms = non_negative_int(config, "scroll.mean_ms", scroll.mean_ms);
    scroll.stddev_ms = non_negative_int(config, "scroll.stddev_ms", scroll.stddev_ms);
    scroll.min_ms = non_negative_int(config, "scroll.min_ms", scroll.min_ms);
    scroll.max_ms = non_negative_int(config, "scroll.max_ms", scroll.max_ms);
    scroll.offset_y = static_cast<int>(config.get_int("scroll.offset_y", scroll.offset_y));
    if (scroll.min_ms > scroll.max_ms) {
        throw ConfigError("scroll.min_ms must not exceed scroll.max_ms");
    }

    FocusConfig& focus = s.supervisor.focus;
    focus.enabled = config.get_bool("focus.enabled", focus.enabled);
    focus.interval_ms = positive_int(config, "focus.interval_ms", focus.interval_ms);

    WatchdogConfig& watchdog = s.supervisor.watchdog;
    watchdog.enabled = config.get_bool("watchdog.enabled", watchdog.enabled);
    watchdog.idle_timeout_ms = positive_int(config, "watchdog.idle_timeout_ms", watchdog.idle_timeout_ms);
    watchdog.check_interval_ms = positive_int(config, "watchdog.check_interval_ms",
                                              watchdog.check_interval_ms);

    ExtractorOptions& ex = s.extractor;
    ex.deadline_ms = positive_int(config, "extract.deadline_ms", ex.deadline_ms);
    ex.retry_interval_ms = positive_int(config, "extract.retry_interval_ms", ex.retry_interval_ms);
    ex.hover = config.get_bool("extract.hover", ex.hover);
    ex.hover_events = config.get_bool("extract.hover_events", ex.hover_events);
    ex.hover_settle_ms = non_negative_int(config, "extract.hover_settle_ms", ex.hover_settle_ms);
    ex.highlight_failures = config.get_bool("extract.highlight_failures", ex.highlight_failures);
    ex.hover_jitter_px = config.get_double("extract.hover_jitter_px", ex.hover_jitter_px);
    if (!(ex.hover_jitter_px >= 0.0)) {
        throw ConfigError("extract.hover_jitter_px must not be negative");
    }

    ExtractionQuery& q = s.query;
    q.container = config.get_string("query.container", q.container);
    q.item = config.get_string("query.item", q.item);
    q.link_selector = config.get_string("query.link_selector", q.link_selector);
    q.link_attribute = config.get_string("query.link_attribute", q.link_attribute);
    q.required_field = config.get_string("query.required_field", q.required_field);
    if (q.container.empty() || q.item.empty()) {
        throw ConfigError("query.container and query.item must not be empty");
    }

    return s;
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : interrupted_(false)
    , exit_code_(EXIT_ALL_SUCCESSFUL)
    , curl_initialized_(false) {
}

bool Application::init(int argc, char* argv[]) {
    Logger::instance().init_from_env();

    // Initialize libcurl globally (must be done before any threads start)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_initialized_ = true;

    try {
        command_line_ = parse_command_line(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n"
                  << "Try '" << argv[0] << " --help' for more information.\n";
        exit_code_ = EXIT_FATAL;
        return false;
    }

    if (command_line_.action == CommandLine::HELP) {
        print_usage(argv[0]);
        return false;
    }
    if (command_line_.action == CommandLine::VERSION) {
        print_version();
        return false;
    }

    // Load configuration
    if (!command_line_.config_path.empty()) {
        if (!config_.load_file(command_line_.config_path)) {
            LOG_WARN("Failed to load config from %s, using defaults",
                     command_line_.config_path.c_str());
        } else {
            LOG_INFO("Loaded config from %s", command_line_.config_path.c_str());
        }
    }

    // Command line wins over the file
    for (Json::const_iterator it = command_line_.overrides.begin();
         it != command_line_.overrides.end(); ++it) {
        config_.set(it.key(), it.value());
    }

    std::string log_level = config_.get_string("log_level", "");
    if (!log_level.empty() && !Logger::instance().set_level_from_string(log_level)) {
        LOG_WARN("Unknown log level '%s', keeping the current level", log_level.c_str());
    }

    try {
        settings_ = RunSettings::from_config(config_);
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        exit_code_ = EXIT_FATAL;
        return false;
    }

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_DEBUG("%s v%s starting", AppInfo::NAME, AppInfo::VERSION);
    return true;
}

int Application::run() {
    try {
        switch (command_line_.action) {
            case CommandLine::LIST:
                exit_code_ = list_targets();
                break;
            case CommandLine::NOTIFY:
                exit_code_ = notify();
                break;
            default:
                exit_code_ = extract();
                break;
        }
    } catch (const ConfigError& e) {
        LOG_ERROR("%s", e.what());
        exit_code_ = EXIT_FATAL;
    } catch (const ExtractionTimeout& e) {
        LOG_ERROR("Timed out waiting for item %d (last status: %s)",
                  e.index(), e.last_status().c_str());
        exit_code_ = EXIT_FATAL;
    } catch (const SessionStopped& e) {
        if (interrupted()) {
            LOG_WARN("Stopped by user.");
        } else {
            LOG_ERROR("Session ended: %s", e.what());
        }
        exit_code_ = EXIT_FATAL;
    } catch (const ChannelError& e) {
        LOG_ERROR("Channel error: %s", e.what());
        exit_code_ = EXIT_FATAL;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: %s", e.what());
        exit_code_ = EXIT_FATAL;
    }
    return exit_code_;
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");
    session_.stop();
    close_channel();

    // Cleanup libcurl global state
    if (curl_initialized_) {
        curl_global_cleanup();
        curl_initialized_ = false;
    }
}

// ============================================================================
// Modes
// ============================================================================

int Application::list_targets() {
    TargetResolver resolver(settings_.endpoint);
    std::vector<TargetDescriptor> targets = resolver.list_targets();
    if (targets.empty()) {
        LOG_WARN("No targets exposed by %s", resolver.endpoint().c_str());
    }
    for (size_t i = 0; i < targets.size(); ++i) {
        std::cout << "[" << targets[i].type << "] "
                  << TargetResolver::format_target(targets[i]) << "\n";
    }
    std::cout.flush();
    return EXIT_ALL_SUCCESSFUL;
}

int Application::notify() {
    TargetDescriptor target = resolve_target();
    connect(target);

    Command enable = commands::enable_runtime();
    channel_->call(enable.method, enable.params);

    Command cmd = commands::evaluate(extraction_script::notify_expression(command_line_.notify_message),
                                     true);
    Json result = channel_->call(cmd.method, cmd.params);
    close_channel();

    std::string thrown = evaluation_exception(result);
    if (!thrown.empty()) {
        LOG_ERROR("Notification script failed: %s", thrown.c_str());
        return EXIT_FATAL;
    }
    std::cout << evaluation_value(result).dump(2) << std::endl;
    return EXIT_ALL_SUCCESSFUL;
}

int Application::extract() {
    TargetDescriptor target = resolve_target();
    connect(target);

    Command page = commands::enable_page();
    Command runtime = commands::enable_runtime();
    channel_->call(page.method, page.params);
    channel_->call(runtime.method, runtime.params);

    if (!settings_.url.empty()) {
        LOG_INFO("Navigating to %s", settings_.url.c_str());
        Command nav = commands::navigate(settings_.url);
        channel_->call(nav.method, nav.params);
    }

    BackgroundTaskSupervisor::Config routines = settings_.supervisor;
    routines.focus.target_id = target.id;

    BackgroundTaskSupervisor supervisor(*channel_, session_, routines);
    ChannelClient* channel = channel_.get();
    supervisor.set_close_function([channel]() { channel->close(); });
    supervisor.set_timeout_callback([](const std::string& reason) {
        LOG_ERROR("Browser went quiet: %s", reason.c_str());
    });

    std::thread watcher(&Application::watch_interrupts, this);

    int status = EXIT_FATAL;
    try {
        supervisor.start();

        PollingExtractor extractor(*channel_, session_, settings_.query, settings_.extractor);
        ExtractionRun result = extractor.run(settings_.start, settings_.count, print_record);
        status = result.success ? EXIT_ALL_SUCCESSFUL : EXIT_SOME_UNSUCCESSFUL;
    } catch (const std::exception&) {
        // The stop hook closes the channel, unblocking routines mid-call
        session_.stop();
        supervisor.join();
        watcher.join();
        throw;
    }

    session_.stop();
    supervisor.join();
    watcher.join();

    BackgroundTaskSupervisor::Stats stats = supervisor.get_stats();
    LOG_DEBUG("Routines: %d scroll command(s), %d focus cycle(s), watchdog %s",
              stats.scroll_commands, stats.focus_cycles,
              stats.watchdog_fired ? "fired" : "idle");
    return status;
}

// ============================================================================
// Helpers
// ============================================================================

TargetDescriptor Application::resolve_target() {
    TargetResolver resolver(settings_.endpoint);
    TargetDescriptor target = resolver.select(settings_.target_id);
    if (target.channel_address.empty()) {
        throw ConfigError("Selected target is missing webSocketDebuggerUrl.");
    }
    return target;
}

void Application::connect(const TargetDescriptor& target) {
    LOG_INFO("Connecting to %s ...", target.channel_address.c_str());
    channel_ = ChannelClient::connect(target.channel_address);

    SessionContext* session = &session_;
    channel_->set_activity_hook([session]() { session->touch(); });
    session_.touch();

    // Any stop (interrupt, watchdog, end of run) fails calls still waiting
    session_.set_stop_hook([this]() { close_channel(); });
}

void Application::close_channel() {
    if (!channel_) return;
    try {
        channel_->close();
    } catch (const ChannelError& e) {
        LOG_DEBUG("Error while closing channel: %s", e.what());
    }
}

void Application::watch_interrupts() {
    while (!session_.stopped()) {
        if (interrupted()) {
            LOG_WARN("Received shutdown signal");
            session_.stop();
            break;
        }
        session_.sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace tabwright
