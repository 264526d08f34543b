#include <cfgref/config/config_loader.hpp>

#include <cfgref/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <vector>

namespace cfgref {

namespace {

Error MakeConfigError(const std::string& message, std::string path = {}) {
    Error error;
    error.operation = "ConfigLoader";
    error.path = std::move(path);
    error.message = message;
    error.category = ErrorCategory::Config;
    return error;
}

std::optional<Command> ParseCommand(std::string_view name) {
    if (name == "resolve") return Command::Resolve;
    if (name == "check") return Command::Check;
    if (name == "graph") return Command::Graph;
    return std::nullopt;
}

std::optional<OutputFormat> ParseOutputFormat(std::string_view name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "yaml" || name == "yml") return OutputFormat::Yaml;
    return std::nullopt;
}

} // anonymous namespace

const char* CommandName(Command command) {
    switch (command) {
        case Command::Resolve: return "resolve";
        case Command::Check:   return "check";
        case Command::Graph:   return "graph";
    }
    return "resolve";
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(path);

        // -- Resolver --
        if (const auto resolver = root["resolver"]) {
            if (resolver["enabled"]) {
                config.resolver.enabled = resolver["enabled"].as<bool>();
            }
            if (resolver["max_depth"]) {
                config.resolver.max_depth = resolver["max_depth"].as<int>();
            }
            if (resolver["open"]) {
                config.resolver.delimiters.open = resolver["open"].as<std::string>();
            }
            if (resolver["close"]) {
                config.resolver.delimiters.close = resolver["close"].as<std::string>();
            }
        }

        // -- Output --
        if (const auto output = root["output"]) {
            if (output["format"]) {
                auto name = output["format"].as<std::string>();
                auto format = ParseOutputFormat(name);
                if (!format.has_value()) {
                    return Result<AppConfig, Error>::Err(MakeConfigError(
                        "Unknown output format '" + name + "' (expected json or yaml)", path));
                }
                config.output_format = format;
            }
            if (output["color"]) {
                auto name = output["color"].as<std::string>();
                auto mode = ParseColorMode(name);
                if (!mode.has_value()) {
                    return Result<AppConfig, Error>::Err(MakeConfigError(
                        "Unknown color mode '" + name + "' (expected auto, always or never)",
                        path));
                }
                config.color = *mode;
            }
        }

        // -- Logging --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level.has_value()) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "Unknown log level '" + name + "'", path));
            }
            config.log_level = level;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to read settings file: " + std::string(e.what()), path));
    }

    config.settings_path = path;
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    if (argc < 2) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Missing command (expected resolve, check or graph)"));
    }
    auto command = ParseCommand(argv[1]);
    if (!command.has_value()) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Unknown command '" + std::string(argv[1]) +
            "' (expected resolve, check or graph)"));
    }

    argparse::ArgumentParser program(std::string("cfgref ") + argv[1], kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("document")
        .help("Configuration document (YAML or JSON)")
        .nargs(argparse::nargs_pattern::optional);

    // Resolver flags
    program.add_argument("--no-resolve-refs")
        .help("Pass the document through without resolving references")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--max-depth")
        .help("Longest allowed reference chain")
        .scan<'i', int>();
    program.add_argument("--open")
        .help("Opening delimiter of a reference expression");
    program.add_argument("--close")
        .help("Closing delimiter of a reference expression");

    // Input/output
    program.add_argument("-p", "--project")
        .help("Directory to search for a configuration document");
    program.add_argument("-s", "--settings")
        .help("Settings file (default: .cfgref.yaml next to the document)");
    program.add_argument("-f", "--format")
        .help("Output format for resolve: json or yaml");

    // Options
    program.add_argument("--json")
        .help("JSON output for messages and errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Only print errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append log messages to a file");
    program.add_argument("--log-format")
        .help("Log line format: text or json");

    std::vector<const char*> args;
    args.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args.push_back(argv[i]);
    }

    try {
        program.parse_args(static_cast<int>(args.size()), args.data());
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.command = *command;

    if (auto val = program.present("document")) {
        config.document_path = *val;
    }

    // Resolver
    if (program.get<bool>("--no-resolve-refs")) {
        config.resolver.enabled = false;
    }
    if (auto val = program.present<int>("--max-depth")) {
        config.resolver.max_depth = *val;
    }
    if (auto val = program.present("--open")) {
        config.resolver.delimiters.open = *val;
    }
    if (auto val = program.present("--close")) {
        config.resolver.delimiters.close = *val;
    }

    // Input/output
    if (auto val = program.present("--project")) {
        config.project_dir = *val;
    }
    if (auto val = program.present("--settings")) {
        config.settings_path = *val;
    }
    if (auto val = program.present("--format")) {
        auto format = ParseOutputFormat(*val);
        if (!format.has_value()) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "Invalid --format '" + *val + "' (expected json or yaml)"));
        }
        config.output_format = format;
    }

    // Options
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--color")) {
        config.color = ColorMode::Always;
    }
    if (program.get<bool>("--no-color")) {
        config.color = ColorMode::Never;
    }
    config.verbosity = verbosity;
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--log-format")) {
        if (*val == "json") {
            config.log_format = LogFormat::Json;
        } else if (*val != "text") {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                "Invalid --log-format '" + *val + "' (expected text or json)"));
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const ResolverOptions defaults;

    merged.command = cli_overrides.command;
    if (cli_overrides.document_path.has_value()) {
        merged.document_path = cli_overrides.document_path;
    }
    if (cli_overrides.project_dir.has_value()) {
        merged.project_dir = cli_overrides.project_dir;
    }
    if (cli_overrides.settings_path.has_value()) {
        merged.settings_path = cli_overrides.settings_path;
    }
    if (cli_overrides.output_format.has_value()) {
        merged.output_format = cli_overrides.output_format;
    }

    // Resolver overrides
    if (!cli_overrides.resolver.enabled) {
        merged.resolver.enabled = false;
    }
    if (cli_overrides.resolver.max_depth != defaults.max_depth) {
        merged.resolver.max_depth = cli_overrides.resolver.max_depth;
    }
    if (cli_overrides.resolver.delimiters.open != defaults.delimiters.open) {
        merged.resolver.delimiters.open = cli_overrides.resolver.delimiters.open;
    }
    if (cli_overrides.resolver.delimiters.close != defaults.delimiters.close) {
        merged.resolver.delimiters.close = cli_overrides.resolver.delimiters.close;
    }

    // Options
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_format != LogFormat::Text) {
        merged.log_format = cli_overrides.log_format;
    }
    if (cli_overrides.color != ColorMode::Auto) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!config.document_path.has_value() && !config.project_dir.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing document: pass a file or --project <dir>"));
    }
    if (config.document_path.has_value() && config.project_dir.has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both a document path and --project"));
    }
    if (config.resolver.max_depth < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("Maximum depth must be at least 1, got " +
                            std::to_string(config.resolver.max_depth)));
    }
    const auto& delimiters = config.resolver.delimiters;
    if (delimiters.open.empty() || delimiters.close.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Expression delimiters must not be empty"));
    }
    if (delimiters.open == delimiters.close) {
        return Result<void, Error>::Err(
            MakeConfigError("Opening and closing delimiters must differ"));
    }
    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

LogLevel LogLevelFor(const AppConfig& config) {
    if (config.quiet) {
        return LogLevel::Error;
    }
    if (config.verbosity >= 2) {
        return LogLevel::Debug;
    }
    if (config.verbosity == 1) {
        return LogLevel::Info;
    }
    return config.log_level.value_or(LogLevel::Warn);
}

} // namespace cfgref
