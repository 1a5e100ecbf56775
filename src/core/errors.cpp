#include <tabwright/core/errors.hpp>
#include <sstream>

namespace tabwright {

namespace {

std::string describe_protocol_error(const std::string& method, const Json& error) {
    std::ostringstream ss;
    ss << method << " failed";
    if (error.is_object()) {
        const Json& code = json_at(error, "code");
        if (code.is_number_integer()) {
            ss << " (" << code.get<int64_t>() << ")";
        }
        std::string msg = json_string(error, "message");
        if (!msg.empty()) ss << ": " << msg;
        std::string data = json_string(error, "data");
        if (!data.empty()) ss << " [" << data << "]";
    } else if (!error.is_null()) {
        ss << ": " << error.dump();
    }
    return ss.str();
}

} // namespace

ProtocolError::ProtocolError(const std::string& method, const Json& error)
    : ChannelError(describe_protocol_error(method, error))
    , method_(method)
    , code_(0)
    , payload_(error) {
    const Json& code = json_at(error, "code");
    if (code.is_number_integer()) code_ = code.get<int64_t>();
    remote_message_ = json_string(error, "message");
}

ExtractionTimeout::ExtractionTimeout(int index, long long waited_ms, const std::string& last_status)
    : std::runtime_error("timed out after " + std::to_string(waited_ms) + "ms waiting for item " +
                         std::to_string(index) +
                         (last_status.empty() ? std::string() : " (last status: " + last_status + ")"))
    , index_(index)
    , last_status_(last_status) {
}

} // namespace tabwright
