#pragma once

#include <cfgref/core/log.hpp>
#include <cfgref/core/terminal.hpp>
#include <cfgref/resolve/resolver_options.hpp>

#include <optional>
#include <string>

namespace cfgref {

enum class Command {
    Resolve,   // print the resolved document
    Check,     // resolve and report success or the error
    Graph,     // print the dependency table
};

enum class OutputFormat {
    Json,
    Yaml,
};

enum class LogFormat {
    Text,
    Json,
};

struct AppConfig {
    Command command = Command::Resolve;
    std::optional<std::string> document_path;
    std::optional<std::string> project_dir;    // look for a document here
    std::optional<std::string> settings_path;  // .cfgref.yaml
    std::optional<OutputFormat> output_format; // default: follow the input
    ResolverOptions resolver;
    std::optional<std::string> log_file;
    LogFormat log_format = LogFormat::Text;
    std::optional<LogLevel> log_level;         // settings file; -v/-vv/-q win
    ColorMode color = ColorMode::Auto;
    bool json_output = false;
    int verbosity = 0;                         // 1 = -v, 2 = -vv
    bool quiet = false;
};

const char* CommandName(Command command);

} // namespace cfgref
