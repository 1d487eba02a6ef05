/*
 * chunkguard C++17 - Configuration Implementation
 */
#include <chunkguard/core/config.hpp>
#include <chunkguard/core/logger.hpp>
#include <chunkguard/core/utils.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <vector>

namespace chunkguard {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path.c_str());
    if (!in) {
        last_error_ = "Cannot open config file: " + path;
        LOG_ERROR("%s", last_error_.c_str());
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!load_string(ss.str())) {
        LOG_ERROR("Failed to load config '%s': %s", path.c_str(), last_error_.c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed = Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        last_error_ = "Invalid JSON";
        return false;
    }
    if (!parsed.is_object()) {
        last_error_ = "Config root must be a JSON object";
        return false;
    }
    data_ = parsed;
    last_error_.clear();
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& key) {
    Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::string Config::get_string(const std::string& key, const std::string& default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_string()) return default_val;
    return v->get<std::string>();
}

int64_t Config::get_int(const std::string& key, int64_t default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return default_val;
    if (v->is_number_float()) {
        double d = v->get<double>();
        // 2^63 is exactly representable; anything at or past it is not an int64
        if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
            LOG_WARN("Config '%s' is out of integer range, using default", key.c_str());
            return default_val;
        }
        return static_cast<int64_t>(d);
    }
    if (v->is_number_unsigned() && v->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        LOG_WARN("Config '%s' is out of integer range, using default", key.c_str());
        return default_val;
    }
    return v->get<int64_t>();
}

double Config::get_double(const std::string& key, double default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_number()) return default_val;
    return v->get<double>();
}

bool Config::get_bool(const std::string& key, bool default_val) const {
    const Json* v = find(key);
    if (!v || !v->is_boolean()) return default_val;
    return v->get<bool>();
}

bool Config::apply_log_level() const {
    std::string level = get_string("log_level", "info");
    if (!Logger::instance().set_level_from_string(level)) {
        LOG_WARN("Unknown log_level '%s', keeping current level", level.c_str());
        return false;
    }
    return true;
}

void Config::set_string(const std::string& key, const std::string& value) { slot(key) = value; }
void Config::set_int(const std::string& key, int64_t value) { slot(key) = value; }
void Config::set_double(const std::string& key, double value) { slot(key) = value; }
void Config::set_bool(const std::string& key, bool value) { slot(key) = value; }

} // namespace chunkguard
