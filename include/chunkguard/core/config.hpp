/*
 * chunkguard C++17 - Configuration
 *
 * JSON-backed settings with dotted-path lookup ("chunking.max_bytes").
 * Missing keys and type mismatches fall back to the supplied default.
 */
#ifndef chunkguard_CORE_CONFIG_HPP
#define chunkguard_CORE_CONFIG_HPP

#include <chunkguard/core/json.hpp>
#include <string>
#include <cstdint>

namespace chunkguard {

class Config {
public:
    Config();
    explicit Config(const Json& data);
    
    // Replace the current settings. Return false (and keep the old
    // settings) when the file cannot be read or is not a JSON object.
    bool load_file(const std::string& path);
    bool load_string(const std::string& text);
    
    std::string get_string(const std::string& key, const std::string& default_val) const;
    int64_t get_int(const std::string& key, int64_t default_val) const;
    double get_double(const std::string& key, double default_val) const;
    bool get_bool(const std::string& key, bool default_val) const;
    bool has(const std::string& key) const;
    
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_double(const std::string& key, double value);
    void set_bool(const std::string& key, bool value);
    
    // Sets the Logger level from "log_level" (default "info"). Returns
    // false and keeps the current level on an unknown name.
    bool apply_log_level() const;
    
    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& key) const;
    Json& slot(const std::string& key);
    
    Json data_;
    std::string last_error_;
};

} // namespace chunkguard

#endif // chunkguard_CORE_CONFIG_HPP
