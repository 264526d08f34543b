#pragma once

#include <cfgref/cli/output_formatter.hpp>
#include <cfgref/config/app_config.hpp>
#include <cfgref/core/result.hpp>

#include <string>

namespace cfgref {

// Path of the document to process: the explicit path, or the first known
// config file name found in --project.
Result<std::string, Error> LocateDocument(const AppConfig& config);

// Merge the settings file under the command-line values. An explicit
// --settings file must exist; otherwise .cfgref.yaml next to the document
// is used when present.
Result<AppConfig, Error> ApplySettingsFile(const AppConfig& cli_config,
                                           const std::string& document_path);

// Each command prints its own output and errors and returns the exit code.
int RunResolve(const AppConfig& config, const std::string& document_path,
               const OutputFormatter& formatter);
int RunCheck(const AppConfig& config, const std::string& document_path,
             const OutputFormatter& formatter);
int RunGraph(const AppConfig& config, const std::string& document_path,
             const OutputFormatter& formatter);

int RunCommand(const AppConfig& config, const std::string& document_path,
               const OutputFormatter& formatter);

} // namespace cfgref
