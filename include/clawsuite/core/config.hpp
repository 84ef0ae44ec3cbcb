#ifndef CLAWSUITE_CORE_CONFIG_HPP
#define CLAWSUITE_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace clawsuite {

class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    // Keys use dot notation for nested sections (e.g. "gateway.auth.token")
    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    // Config value, else the environment variable env_name, else def.
    // Empty strings count as unset in both places.
    std::string get_string_env(const std::string& key, const char* env_name,
                               const std::string& def = "") const;

    // Set a value, creating intermediate sections
    void set(const std::string& key, const Json& value);

    // Get nested object (null when absent)
    const Json& get_section(const std::string& key) const;

    // Raw data access
    const Json& data() const;

private:
    Json data_;

    const Json* find(const std::string& key) const;
};

} // namespace clawsuite

#endif // CLAWSUITE_CORE_CONFIG_HPP
