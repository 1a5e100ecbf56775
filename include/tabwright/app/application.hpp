/*
 * tabwright - Application Class
 *
 * Command-line front end: merges defaults, the JSON config file and CLI
 * flags, resolves a target, and runs one of list / notify / extract.
 */
#ifndef TABWRIGHT_APP_APPLICATION_HPP
#define TABWRIGHT_APP_APPLICATION_HPP

#include <tabwright/cdp/channel_client.hpp>
#include <tabwright/core/config.hpp>
#include <tabwright/core/types.hpp>
#include <tabwright/extract/polling_extractor.hpp>
#include <tabwright/session/session_context.hpp>
#include <tabwright/session/supervisor.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace tabwright {

// ============================================================================
// Application Configuration Constants
// ============================================================================

struct AppInfo {
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* NAME = "tabwright";
    static constexpr const char* DEFAULT_ENDPOINT = "http://127.0.0.1:2102";
};

// Exit statuses
enum ExitCode {
    EXIT_ALL_SUCCESSFUL = 0,
    EXIT_FATAL = 1,
    EXIT_SOME_UNSUCCESSFUL = 2
};

// ============================================================================
// Command line
// ============================================================================

struct CommandLine {
    enum Action { RUN, LIST, NOTIFY, HELP, VERSION };

    Action action;
    std::string config_path;
    std::string notify_message;
    Json overrides;                // dotted config key -> value

    CommandLine() : action(RUN), overrides(Json::object()) {}
};

// Throws ConfigError on an unknown flag, a missing value or a bad number
CommandLine parse_command_line(int argc, char* argv[]);

// Image search URL for --query
std::string image_search_url(const std::string& query);

// ============================================================================
// Run settings
// ============================================================================

// Everything a run needs, read out of the merged Config
struct RunSettings {
    std::string endpoint;
    std::string target_id;
    std::string url;
    int start;
    int count;
    BackgroundTaskSupervisor::Config supervisor;
    ExtractorOptions extractor;
    ExtractionQuery query;

    RunSettings() : endpoint(AppInfo::DEFAULT_ENDPOINT), start(0), count(10) {}

    // Throws ConfigError for out-of-range values
    static RunSettings from_config(const Config& config);
};

// ============================================================================
// Application Class - Singleton
// ============================================================================

class Application {
public:
    static Application& instance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    Config& config() { return config_; }
    const Config& config() const { return config_; }
    SessionContext& session() { return session_; }

    // Returns false when the process should exit right away (help, version,
    // bad arguments); exit_code() then holds the status.
    bool init(int argc, char* argv[]);

    int run();

    void shutdown();

    // Safe from a signal handler: only raises a flag
    void request_stop() { interrupted_.store(true); }
    bool interrupted() const { return interrupted_.load(); }

    int exit_code() const { return exit_code_; }

private:
    Application();

    int list_targets();
    int notify();
    int extract();

    TargetDescriptor resolve_target();
    void connect(const TargetDescriptor& target);
    void close_channel();

    // Turns a pending interrupt into session stop; runs until the session ends
    void watch_interrupts();

    Config config_;
    CommandLine command_line_;
    RunSettings settings_;
    SessionContext session_;
    std::unique_ptr<ChannelClient> channel_;
    std::atomic<bool> interrupted_;
    int exit_code_;
    bool curl_initialized_;
};

} // namespace tabwright

#endif // TABWRIGHT_APP_APPLICATION_HPP
