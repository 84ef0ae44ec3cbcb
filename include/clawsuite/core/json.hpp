#ifndef CLAWSUITE_CORE_JSON_HPP
#define CLAWSUITE_CORE_JSON_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace clawsuite {

typedef nlohmann::json Json;

// Parse without throwing. Returns false and fills error on malformed input.
bool json_try_parse(const std::string& text, Json& out, std::string* error = nullptr);

// Read a string member, accepting integers rendered as decimal strings
std::string json_string_field(const Json& obj, const std::string& key,
                              const std::string& def = "");

} // namespace clawsuite

#endif // CLAWSUITE_CORE_JSON_HPP
