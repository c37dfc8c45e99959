#ifndef SITEMIRROR_CORE_CONFIG_HPP
#define SITEMIRROR_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <fstream>
#include <cstdlib>

namespace sitemirror {

class Config {
public:
    Config();
    
    // Load from JSON file
    bool load_file(const std::string& path);
    
    // Load from JSON string
    bool load_string(const std::string& json_str);
    
    // Lookups accept dot notation ("render.timeout_ms"). A matching
    // environment variable (SITEMIRROR_RENDER_TIMEOUT_MS) takes precedence.
    std::string get_string(const std::string& key, const std::string& def = "") const;
    
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    
    bool get_bool(const std::string& key, bool def = false) const;
    
    // Raw data access
    const Json& data() const;

    // "render.timeout_ms" -> "SITEMIRROR_RENDER_TIMEOUT_MS"
    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    
    const Json* find(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace sitemirror

#endif // SITEMIRROR_CORE_CONFIG_HPP
