#include <clawsuite/core/json.hpp>

namespace clawsuite {

bool json_try_parse(const std::string& text, Json& out, std::string* error) {
    try {
        out = Json::parse(text);
        return true;
    } catch (const Json::parse_error& e) {
        if (error) *error = e.what();
        return false;
    }
}

std::string json_string_field(const Json& obj, const std::string& key,
                              const std::string& def) {
    if (!obj.is_object()) return def;
    Json::const_iterator it = obj.find(key);
    if (it == obj.end()) return def;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_number_unsigned()) return std::to_string(it->get<uint64_t>());
    return def;
}

} // namespace clawsuite
