#ifndef TABWRIGHT_CORE_TYPES_HPP
#define TABWRIGHT_CORE_TYPES_HPP

#include <tabwright/core/json.hpp>
#include <string>
#include <vector>

namespace tabwright {

// Remote page/tab as exposed by the browser's /json/list endpoint
struct TargetDescriptor {
    std::string id;
    std::string type;             // "page", "iframe", "service_worker", ...
    std::string url;
    std::string title;
    std::string channel_address;  // webSocketDebuggerUrl
};

// Status tag returned by the page-side extraction function
enum class ExtractionStatus {
    WAITING_FOR_CONTAINER,
    WAITING_FOR_ITEM,
    OUT_OF_RANGE,
    OK,
    UNKNOWN                       // missing or unrecognised payload
};

const char* status_name(ExtractionStatus status);
ExtractionStatus parse_status(const std::string& name);

// One unit of output per requested index. Built once, never mutated.
struct ExtractionRecord {
    int index;
    ExtractionStatus status;
    bool success;                 // required link-like field present
    bool refined;                 // payload came from the hover re-read
    Json fields;
    Json raw;                     // full page payload
    
    ExtractionRecord()
        : index(-1)
        , status(ExtractionStatus::UNKNOWN)
        , success(false)
        , refined(false) {}
    
    Json to_json() const;
};

// Ordered output of one extraction run
struct ExtractionRun {
    std::vector<ExtractionRecord> records;
    bool success;                 // AND of every appended record
    bool reached_end;             // stopped early on out_of_range
    
    ExtractionRun() : success(true), reached_end(false) {}
};

// Result of a best-effort sub-step; the caller decides whether to care
struct StepResult {
    bool success;
    std::string error;
    
    StepResult() : success(false) {}
    
    static StepResult ok() {
        StepResult r;
        r.success = true;
        return r;
    }
    
    static StepResult fail(const std::string& err) {
        StepResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

} // namespace tabwright

#endif // TABWRIGHT_CORE_TYPES_HPP
