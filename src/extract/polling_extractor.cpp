/*
 * tabwright - Polling extractor implementation
 */
#include <tabwright/extract/polling_extractor.hpp>
#include <tabwright/cdp/commands.hpp>
#include <tabwright/core/errors.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>

#include <algorithm>
#include <limits>

namespace tabwright {

namespace {

// Pointer path around the item centre, in units of the jitter radius
const double kJitterPath[][2] = {
    { -1.0, -0.75 },
    { -0.5,  0.75 },
    {  0.75, -0.5 },
    {  0.25,  0.25 },
    {  0.0,   0.0 }
};

} // anonymous namespace

PollingExtractor::PollingExtractor(CommandSender& sender, SessionContext& session,
                                   const ExtractionQuery& query,
                                   const ExtractorOptions& options)
    : sender_(sender)
    , session_(session)
    , query_(query)
    , options_(options) {
}

ExtractionStatus PollingExtractor::classify(const Json& value) {
    if (!value.is_object()) return ExtractionStatus::UNKNOWN;
    const Json& status = json_at(value, "status");
    if (!status.is_string()) return ExtractionStatus::UNKNOWN;
    return parse_status(status.get<std::string>());
}

Json PollingExtractor::read_item(int index) {
    Command cmd = commands::evaluate(extraction_script::item_expression(query_, index), true);
    Json result = sender_.call(cmd.method, cmd.params);

    std::string thrown = evaluation_exception(result);
    if (!thrown.empty()) {
        LOG_DEBUG("[extract] item script threw: %s", thrown.c_str());
    }
    return evaluation_value(result);
}

// ============================================================================
// Per-index polling
// ============================================================================

bool PollingExtractor::extract_index(int index, ExtractionRecord& record) {
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    bool have_seen = false;
    ExtractionStatus seen = ExtractionStatus::UNKNOWN;
    Json value;

    for (;;) {
        if (session_.stopped()) {
            throw SessionStopped("session stopped while polling item " + std::to_string(index));
        }

        try {
            value = read_item(index);
        } catch (const ChannelError&) {
            // Stopping the session closes the channel under a pending read
            if (session_.stopped()) {
                throw SessionStopped("session stopped while polling item " + std::to_string(index));
            }
            throw;
        }
        ExtractionStatus status = classify(value);

        if (status == ExtractionStatus::OK) {
            break;
        }
        if (status == ExtractionStatus::OUT_OF_RANGE) {
            LOG_INFO("[extract] item %d out of range (%lld available)", index,
                     static_cast<long long>(json_at(value, "count").is_number_integer()
                                            ? json_at(value, "count").get<int64_t>() : 0));
            return false;
        }

        // Unrecognised payloads count as waiting but are not reported
        if (status != ExtractionStatus::UNKNOWN && (!have_seen || status != seen)) {
            LOG_INFO("[extract] Waiting for DOM elements: %s", status_name(status));
            have_seen = true;
            seen = status;
            if (observer_) observer_(index, status);
        }

        int64_t waited = elapsed_ms(started);
        if (waited >= options_.deadline_ms) {
            throw ExtractionTimeout(index, waited, status_name(seen));
        }

        int64_t pause = std::min<int64_t>(options_.retry_interval_ms, options_.deadline_ms - waited);
        if (!session_.sleep_for(std::chrono::milliseconds(pause))) {
            throw SessionStopped("session stopped while polling item " + std::to_string(index));
        }
    }

    record.index = index;
    record.status = ExtractionStatus::OK;
    record.raw = value;
    record.fields = json_at(value, "fields");
    record.refined = false;

    // Hover refinement never fails the index
    ItemRect rect = ItemRect::from_json(json_at(value, "rect"));
    if (options_.hover && !rect.degenerate()) {
        StepResult hovered = hover(index, rect);
        if (!hovered.success) {
            LOG_WARN("[hover] item %d: %s; keeping original read", index, hovered.error.c_str());
        } else {
            try {
                Json reread = read_item(index);
                if (classify(reread) == ExtractionStatus::OK) {
                    record.raw = reread;
                    record.fields = json_at(reread, "fields");
                    record.refined = true;
                } else {
                    LOG_DEBUG("[hover] item %d re-read returned %s; keeping original read",
                              index, status_name(classify(reread)));
                }
            } catch (const ChannelError& e) {
                LOG_WARN("[hover] item %d re-read failed: %s; keeping original read", index, e.what());
            }
        }
    }

    record.success = has_required_field(record.fields, query_.required_field);
    if (!record.success) {
        LOG_WARN("[extract] item %d: no %s found", index, query_.required_field.c_str());
        if (options_.highlight_failures) {
            StepResult highlighted = highlight_failure(index);
            if (!highlighted.success) {
                LOG_DEBUG("[extract] highlight for item %d skipped: %s", index,
                          highlighted.error.c_str());
            }
        }
    }

    LOG_DEBUG("[extract] item %d read in %s%s", index,
              format_duration_ms(elapsed_ms(started)).c_str(), record.refined ? " (refined)" : "");
    return true;
}

// ============================================================================
// Run
// ============================================================================

ExtractionRun PollingExtractor::run(int start, int count, RecordSink sink) {
    ExtractionRun result;

    int64_t end = static_cast<int64_t>(start) + count;
    if (start < 0 || count < 0 || end - 1 > std::numeric_limits<int>::max()) {
        throw ConfigError("item range " + std::to_string(start) + "+" + std::to_string(count) +
                          " is outside 0.." + std::to_string(std::numeric_limits<int>::max()));
    }

    for (int64_t i = start; i < end; ++i) {
        int index = static_cast<int>(i);
        ExtractionRecord record;
        if (!extract_index(index, record)) {
            result.reached_end = true;
            break;
        }

        result.records.push_back(record);
        result.success = result.success && record.success;
        if (sink) sink(record);
    }

    LOG_INFO("[extract] run finished: %zu record(s), %s%s", result.records.size(),
             result.success ? "all successful" : "some unsuccessful",
             result.reached_end ? ", reached end of list" : "");
    return result;
}

// ============================================================================
// Side steps
// ============================================================================

StepResult PollingExtractor::hover(int index, const ItemRect& rect) {
    try {
        double cx = rect.center_x();
        double cy = rect.center_y();
        for (size_t i = 0; i < sizeof(kJitterPath) / sizeof(kJitterPath[0]); ++i) {
            Command move = commands::dispatch_mouse_event(
                "mouseMoved",
                cx + kJitterPath[i][0] * options_.hover_jitter_px,
                cy + kJitterPath[i][1] * options_.hover_jitter_px);
            sender_.call(move.method, move.params);
        }

        if (options_.hover_events) {
            Command fire = commands::evaluate(extraction_script::hover_expression(query_, index), true);
            Json found = evaluation_value(sender_.call(fire.method, fire.params));
            if (!found.is_boolean() || !found.get<bool>()) {
                return StepResult::fail("hover target disappeared");
            }
        }
    } catch (const ChannelError& e) {
        return StepResult::fail(e.what());
    }

    if (!session_.sleep_for(std::chrono::milliseconds(options_.hover_settle_ms))) {
        return StepResult::fail("session stopped");
    }
    return StepResult::ok();
}

StepResult PollingExtractor::highlight_failure(int index) {
    Command cmd = commands::evaluate(extraction_script::highlight_expression(query_, index), true);
    try {
        Json found = evaluation_value(sender_.call(cmd.method, cmd.params));
        if (!found.is_boolean() || !found.get<bool>()) {
            return StepResult::fail("item not found");
        }
    } catch (const ChannelError& e) {
        return StepResult::fail(e.what());
    }
    return StepResult::ok();
}

} // namespace tabwright
