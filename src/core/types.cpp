#include <tabwright/core/types.hpp>

namespace tabwright {

const char* status_name(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::WAITING_FOR_CONTAINER: return "waiting_for_container";
        case ExtractionStatus::WAITING_FOR_ITEM: return "waiting_for_item";
        case ExtractionStatus::OUT_OF_RANGE: return "out_of_range";
        case ExtractionStatus::OK: return "ok";
        default: return "unknown";
    }
}

ExtractionStatus parse_status(const std::string& name) {
    if (name == "waiting_for_container") return ExtractionStatus::WAITING_FOR_CONTAINER;
    if (name == "waiting_for_item") return ExtractionStatus::WAITING_FOR_ITEM;
    if (name == "out_of_range") return ExtractionStatus::OUT_OF_RANGE;
    if (name == "ok") return ExtractionStatus::OK;
    return ExtractionStatus::UNKNOWN;
}

Json ExtractionRecord::to_json() const {
    Json j = Json::object();
    j["index"] = index;
    j["status"] = status_name(status);
    j["success"] = success;
    j["refined"] = refined;
    j["fields"] = fields.is_null() ? Json::object() : fields;
    return j;
}

} // namespace tabwright
