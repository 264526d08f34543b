#pragma once

#include <cfgref/value/config_value.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace cfgref {

// Key order is kept. NaN and infinities become null, as JSON has no
// spelling for them.
nlohmann::ordered_json ToJson(const ConfigValue& value);

// indent < 0 gives the compact single-line form.
std::string ToJsonText(const ConfigValue& value, int indent = 2);

// Block-style YAML. Strings that would read back as another type
// ("5", "true", "null", "") are double-quoted.
std::string ToYamlText(const ConfigValue& value);

} // namespace cfgref
