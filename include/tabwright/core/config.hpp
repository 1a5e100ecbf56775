#ifndef TABWRIGHT_CORE_CONFIG_HPP
#define TABWRIGHT_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace tabwright {

class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    // Keys use dot notation for nested sections ("scroll.mean_ms").
    // get_string falls back to TABWRIGHT_<KEY> in the environment.
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    double get_double(const std::string& key, double def = 0.0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    bool has(const std::string& key) const;
    
    // Override a single key (CLI flags land here)
    void set(const std::string& key, const Json& value);
    
    // Raw data access
    const Json& data() const;

    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    
    const Json* lookup(const std::string& key) const;
};

} // namespace tabwright

#endif // TABWRIGHT_CORE_CONFIG_HPP
