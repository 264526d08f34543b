#pragma once

#include <cfgref/value/config_value.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cfgref {

// ---------------------------------------------------------------------------
// LeafPath helpers: dotted addresses into a ConfigValue tree.
//
// Segments are map keys or decimal list indices: "services.api.name",
// "services.0". The empty path addresses the root. Keys that contain '.'
// cannot be addressed.
// ---------------------------------------------------------------------------

std::string JoinPath(std::string_view parent, std::string_view segment);

std::vector<std::string> SplitPath(std::string_view path);

/// True if path equals ancestor or lies beneath it ("a.b" is under "a",
/// "ab" is not).
bool IsSameOrDescendant(std::string_view path, std::string_view ancestor);

/// Follow a path from the root. Map keys take precedence over list
/// indices; a numeric segment indexes into a list. Returns nullptr when
/// any segment is missing.
const ConfigValue* LookupPath(const ConfigValue& root, std::string_view path);
ConfigValue* LookupPath(ConfigValue& root, std::string_view path);

using TreeVisitor =
    std::function<void(const std::string& path, const ConfigValue& value)>;

/// Pre-order walk over every value beneath the root (the root itself is not
/// visited). Map entries are visited in document order, list items by index.
void WalkTree(const ConfigValue& root, const TreeVisitor& visit);

} // namespace cfgref
