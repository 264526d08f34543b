#pragma once

#include <cfgref/config/app_config.hpp>
#include <cfgref/core/log.hpp>
#include <cfgref/core/result.hpp>

#include <string>
#include <string_view>

namespace cfgref {

// Name of the per-project settings file picked up next to the document.
constexpr const char* kSettingsFileName = ".cfgref.yaml";

// Parse a settings file:
//   resolver: { enabled, max_depth, open, close }
//   output:   { format: json|yaml, color: auto|always|never }
//   log_file: path
//   log_level: debug|info|warn|error
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse "cfgref <command> [document] [flags]". argv[1] must be the command.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields left at their defaults in cli_overrides keep the yaml_base value.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Check that the values are usable before anything is loaded.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Minimum log level: Error for -q, Debug for -vv, Info for -v, otherwise
// the settings file level, defaulting to Warn.
LogLevel LogLevelFor(const AppConfig& config);

} // namespace cfgref
