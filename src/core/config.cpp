#include <clawsuite/core/config.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>

namespace clawsuite {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    Json parsed;
    std::string error;
    if (!json_try_parse(json_str, parsed, &error)) {
        LOG_ERROR("Config: parse error: %s", error.c_str());
        return false;
    }
    if (!parsed.is_object()) {
        LOG_ERROR("Config: top level must be an object");
        return false;
    }
    data_ = parsed;
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

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* v = find(key);
    if (v && v->is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<std::string>();
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* v = find(key);
    if (v && v->is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<int64_t>();
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json* v = find(key);
    if (v && v->is_number()) {
        return v->get<double>();
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* v = find(key);
    if (v && v->is_boolean()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v->get<bool>();
    }
    return def;
}

std::string Config::get_string_env(const std::string& key, const char* env_name,
                                   const std::string& def) const {
    std::string value = trim(get_string(key, ""));
    if (!value.empty()) return value;

    if (env_name) {
        const char* env = std::getenv(env_name);
        if (env) {
            value = trim(env);
            if (!value.empty()) {
                LOG_DEBUG("Config: '%s' taken from $%s", key.c_str(), env_name);
                return value;
            }
        }
    }
    return def;
}

void Config::set(const std::string& key, const Json& value) {
    std::vector<std::string> parts = split(key, '.');
    if (parts.empty()) return;

    Json* node = &data_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        Json& next = (*node)[parts[i]];
        if (!next.is_object()) next = Json::object();
        node = &next;
    }
    (*node)[parts.back()] = value;
}

const Json& Config::get_section(const std::string& key) const {
    static const Json null_json;
    const Json* v = find(key);
    return v ? *v : null_json;
}

const Json& Config::data() const { return data_; }

} // namespace clawsuite
