#include <tabwright/core/config.hpp>
#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>
#include <fstream>
#include <cstdlib>

namespace tabwright {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        LOG_ERROR("Config: cannot open '%s'", path.c_str());
        return false;
    }
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level must be an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        LOG_ERROR("Config: parse error: %s", e.what());
        return false;
    }
}

const Json* Config::lookup(const std::string& key) const {
    const Json* node = &data_;
    size_t start = 0;
    while (true) {
        size_t dot_pos = key.find('.', start);
        std::string part = key.substr(start, dot_pos == std::string::npos
                                             ? std::string::npos : dot_pos - start);
        if (!node->is_object()) return NULL;
        Json::const_iterator it = node->find(part);
        if (it == node->end()) return NULL;
        node = &(*it);
        if (dot_pos == std::string::npos) break;
        start = dot_pos + 1;
    }
    return node;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = lookup(key);
    if (v && v->is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<std::string>();
    }
    
    const char* env = std::getenv(to_env_key(key).c_str());
    if (env && *env) {
        LOG_DEBUG("Config: key '%s' taken from environment", key.c_str());
        return env;
    }

    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = lookup(key);
    if (v && v->is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->is_number_integer() ? v->get<int64_t>()
                                      : static_cast<int64_t>(v->get<double>());
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = lookup(key);
    if (v && v->is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<double>();
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = lookup(key);
    if (v && v->is_boolean()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<bool>();
    }
    return def;
}

bool Config::has(const std::string& key) const {
    return lookup(key) != NULL;
}

void Config::set(const std::string& key, const Json& value) {
    Json* node = &data_;
    size_t start = 0;
    while (true) {
        size_t dot_pos = key.find('.', start);
        if (!node->is_object()) *node = Json::object();
        if (dot_pos == std::string::npos) {
            (*node)[key.substr(start)] = value;
            return;
        }
        node = &(*node)[key.substr(start, dot_pos - start)];
        start = dot_pos + 1;
    }
}

const Json& Config::data() const { return data_; }

std::string Config::to_env_key(const std::string& key) {
    std::string env = "TABWRIGHT_" + to_upper(key);
    for (size_t i = 0; i < env.size(); ++i) {
        if (env[i] == '.' || env[i] == '-') env[i] = '_';
    }
    return env;
}

} // namespace tabwright
