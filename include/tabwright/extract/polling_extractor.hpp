/*
 * tabwright - Polling extractor
 *
 * For each requested index, evaluates the item script until the page reports
 * "ok" or the per-index deadline passes. "out_of_range" ends the whole run
 * without failing it. A successful read may be refined by hovering the item
 * and reading it once more.
 */
#ifndef TABWRIGHT_EXTRACT_POLLING_EXTRACTOR_HPP
#define TABWRIGHT_EXTRACT_POLLING_EXTRACTOR_HPP

#include <tabwright/cdp/command_sender.hpp>
#include <tabwright/core/types.hpp>
#include <tabwright/extract/extraction_script.hpp>
#include <tabwright/session/session_context.hpp>

#include <functional>
#include <string>

namespace tabwright {

struct ExtractorOptions {
    int deadline_ms;               // per index, wall clock
    int retry_interval_ms;
    bool hover;                    // hover refinement on "ok"
    bool hover_events;             // also fire DOM hover events on the item
    int hover_settle_ms;
    double hover_jitter_px;        // radius of the pointer path around the centre
    bool highlight_failures;       // outline items without the required field

    ExtractorOptions()
        : deadline_ms(20000)
        , retry_interval_ms(500)
        , hover(true)
        , hover_events(true)
        , hover_settle_ms(350)
        , hover_jitter_px(4.0)
        , highlight_failures(true)
    {}
};

class PollingExtractor {
public:
    typedef std::function<void(const ExtractionRecord& record)> RecordSink;
    typedef std::function<void(int index, ExtractionStatus status)> StatusObserver;

    PollingExtractor(CommandSender& sender, SessionContext& session,
                     const ExtractionQuery& query,
                     const ExtractorOptions& options = ExtractorOptions());

    // Called once per change of recognised waiting status, never per retry
    void set_status_observer(StatusObserver observer) { observer_ = observer; }

    // Polls one index. Returns false on out_of_range (nothing written to
    // `record`). Throws ExtractionTimeout, SessionStopped or ChannelError.
    bool extract_index(int index, ExtractionRecord& record);

    // Indices [start, start + count) in order. Each record goes to `sink` as
    // soon as it is appended, so earlier records survive a later throw.
    // A range reaching past INT_MAX, or a negative bound, is a ConfigError.
    ExtractionRun run(int start, int count, RecordSink sink = RecordSink());

    // Best-effort sub-steps; errors come back in the StepResult
    StepResult hover(int index, const ItemRect& rect);
    StepResult highlight_failure(int index);

    // Classify an evaluation value; anything unrecognised is UNKNOWN
    static ExtractionStatus classify(const Json& value);

private:
    PollingExtractor(const PollingExtractor&);
    PollingExtractor& operator=(const PollingExtractor&);

    // One Runtime.evaluate of the item script; returns the page value
    Json read_item(int index);

    CommandSender& sender_;
    SessionContext& session_;
    ExtractionQuery query_;
    ExtractorOptions options_;
    StatusObserver observer_;
};

} // namespace tabwright

#endif // TABWRIGHT_EXTRACT_POLLING_EXTRACTOR_HPP
