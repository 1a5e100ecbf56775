#include <tabwright/core/json.hpp>

namespace tabwright {

const Json& json_at(const Json& obj, const std::string& key) {
    static const Json null_json;
    if (!obj.is_object()) return null_json;
    Json::const_iterator it = obj.find(key);
    return it != obj.end() ? *it : null_json;
}

std::string json_string(const Json& obj, const std::string& key, const std::string& def) {
    const Json& v = json_at(obj, key);
    return v.is_string() ? v.get<std::string>() : def;
}

std::string json_dump_ascii(const Json& value) {
    return value.dump(-1, ' ', true);
}

} // namespace tabwright
