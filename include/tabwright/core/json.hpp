#ifndef TABWRIGHT_CORE_JSON_HPP
#define TABWRIGHT_CORE_JSON_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace tabwright {

typedef nlohmann::json Json;

// Null-safe nested lookups used on CDP payloads
const Json& json_at(const Json& obj, const std::string& key);

std::string json_string(const Json& obj, const std::string& key, const std::string& def = "");

// Serialise as pure-ASCII JSON (safe to embed as a script literal)
std::string json_dump_ascii(const Json& value);

} // namespace tabwright

#endif // TABWRIGHT_CORE_JSON_HPP
