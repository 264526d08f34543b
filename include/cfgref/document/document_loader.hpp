#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/value/config_value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cfgref {

enum class DocumentFormat {
    Auto,   // YAML first, then JSON
    Yaml,
    Json,
};

// Format implied by a file name: .yml/.yaml -> Yaml, .json -> Json,
// anything else -> Auto.
DocumentFormat FormatFromPath(std::string_view path);

/// Read and parse a configuration document. A missing or unreadable file and
/// a parse failure are DocumentLoad errors carrying the file path. An empty
/// YAML document loads as an empty map.
Result<ConfigValue, Error> LoadDocument(std::string_view path);

/// Parse a document held in memory. source_name labels errors.
Result<ConfigValue, Error> ParseDocument(std::string_view text,
                                         DocumentFormat format,
                                         std::string_view source_name = "<input>");

/// Type an unquoted YAML scalar with the YAML 1.2 core schema: null, bool,
/// int (decimal, 0x, 0o), float (including .inf and .nan), else string.
ConfigValue ParsePlainScalar(const std::string& text);

// Names looked for by FindConfigFile, in order.
const std::vector<std::string>& ConfigFileCandidates();

/// First candidate that exists as a regular file in project_dir.
Result<std::string, Error> FindConfigFile(std::string_view project_dir);

} // namespace cfgref
