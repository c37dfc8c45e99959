#include <sitemirror/core/config.hpp>
#include <sitemirror/core/logger.hpp>
#include <sitemirror/core/utils.hpp>

namespace sitemirror {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;
    
    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            LOG_WARN("Config: top-level value is not an object");
            return false;
        }
        data_ = parsed;
        return true;
    } catch (const Json::parse_error& e) {
        LOG_WARN("Config: parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& key) const {
    // Walk dot-separated sections ("fetch.workers")
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object() || !node->contains(parts[i])) {
            LOG_DEBUG("Config: key '%s' not found", key.c_str());
            return NULL;
        }
        node = &(*node)[parts[i]];
    }
    LOG_DEBUG("Config: found key '%s'", key.c_str());
    return node;
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "SITEMIRROR_";
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        env += (c == '.' || c == '-') ? '_' : c;
    }
    return to_upper(env);
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* value = std::getenv(to_env_key(key).c_str());
    if (!value) return false;
    out = value;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    std::string env;
    if (env_value(key, env)) return env;

    const Json* node = find(key);
    if (node && node->is_string()) {
        return node->get<std::string>();
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0' && !env.empty()) {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("Config: ignoring non-numeric %s=%s", to_env_key(key).c_str(), env.c_str());
    }

    const Json* node = find(key);
    if (node && node->is_number()) {
        return node->get<int64_t>();
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    std::string env;
    if (env_value(key, env)) {
        std::string lower = to_lower(trim(env));
        if (lower == "1" || lower == "true" || lower == "yes") return true;
        if (lower == "0" || lower == "false" || lower == "no") return false;
    }

    const Json* node = find(key);
    if (node && node->is_boolean()) {
        return node->get<bool>();
    }
    return def;
}

const Json& Config::data() const { return data_; }

} // namespace sitemirror
