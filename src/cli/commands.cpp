#include <cfgref/cli/commands.hpp>

#include <cfgref/config/config_loader.hpp>
#include <cfgref/core/log.hpp>
#include <cfgref/document/document_loader.hpp>
#include <cfgref/document/document_writer.hpp>
#include <cfgref/resolve/resolver.hpp>

#include <filesystem>

namespace cfgref {

namespace {

namespace fs = std::filesystem;

constexpr int kExitSuccess = 0;

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

// Load the document and resolve it with the configured options.
Result<ResolvedTree, Error> LoadAndResolve(const AppConfig& config,
                                           const std::string& document_path) {
    auto document = LoadDocument(document_path);
    if (document.IsErr()) {
        return Result<ResolvedTree, Error>::Err(std::move(document).Error());
    }
    LogInfo("cli", "loaded " + document_path);

    Resolver resolver(config.resolver);
    return resolver.Resolve(document.Value());
}

} // anonymous namespace

Result<std::string, Error> LocateDocument(const AppConfig& config) {
    if (config.document_path.has_value()) {
        return Result<std::string, Error>::Ok(*config.document_path);
    }
    if (config.project_dir.has_value()) {
        auto found = FindConfigFile(*config.project_dir);
        if (found.IsOk()) {
            LogInfo("cli", "using configuration document " + found.Value());
        }
        return found;
    }
    Error error;
    error.operation = "ConfigLoader";
    error.message = "Missing document: pass a file or --project <dir>";
    error.category = ErrorCategory::Config;
    return Result<std::string, Error>::Err(std::move(error));
}

Result<AppConfig, Error> ApplySettingsFile(const AppConfig& cli_config,
                                           const std::string& document_path) {
    std::string settings_path;
    if (cli_config.settings_path.has_value()) {
        settings_path = *cli_config.settings_path;
    } else {
        const auto candidate = fs::path(document_path).parent_path() / kSettingsFileName;
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            return Result<AppConfig, Error>::Ok(cli_config);
        }
        settings_path = candidate.string();
    }

    auto settings = LoadFromYaml(settings_path);
    if (settings.IsErr()) {
        return settings;
    }
    LogDebug("cli", "applied settings from " + settings_path);
    return Result<AppConfig, Error>::Ok(MergeConfigs(settings.Value(), cli_config));
}

// ---------------------------------------------------------------------------
// resolve
// ---------------------------------------------------------------------------
int RunResolve(const AppConfig& config, const std::string& document_path,
               const OutputFormatter& formatter) {
    auto resolved = LoadAndResolve(config, document_path);
    if (resolved.IsErr()) {
        formatter.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }

    auto format = config.output_format.value_or(
        FormatFromPath(document_path) == DocumentFormat::Yaml ? OutputFormat::Yaml
                                                             : OutputFormat::Json);
    const auto& tree = resolved.Value().tree;
    formatter.PrintDocument(format == OutputFormat::Yaml ? ToYamlText(tree)
                                                         : ToJsonText(tree));
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// check
// ---------------------------------------------------------------------------
int RunCheck(const AppConfig& config, const std::string& document_path,
             const OutputFormatter& formatter) {
    auto resolved = LoadAndResolve(config, document_path);
    if (resolved.IsErr()) {
        formatter.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }

    const auto& report = resolved.Value().report;
    std::string message = document_path + ": ";
    if (report.skipped) {
        message += "reference resolution disabled";
    } else if (report.nodes.empty()) {
        message += "no references";
    } else {
        message += std::to_string(report.nodes.size()) + " references resolved (longest chain " +
                   std::to_string(report.max_depth_seen) + ")";
    }
    if (!config.quiet) {
        formatter.PrintSuccess(message);
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// graph
// ---------------------------------------------------------------------------
int RunGraph(const AppConfig& config, const std::string& document_path,
             const OutputFormatter& formatter) {
    if (!config.resolver.enabled) {
        formatter.PrintSuccess(document_path + ": reference resolution disabled");
        return kExitSuccess;
    }

    auto resolved = LoadAndResolve(config, document_path);
    if (resolved.IsErr()) {
        formatter.PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }

    const auto& report = resolved.Value().report;
    std::vector<std::vector<std::string>> rows;
    rows.reserve(report.nodes.size());
    for (const auto& node : report.nodes) {
        rows.push_back({
            node.path,
            JoinNames(node.references),
            JoinNames(node.dependencies),
            std::to_string(node.depth),
            std::to_string(node.position + 1),
        });
    }
    formatter.PrintTable({"node", "references", "waits for", "depth", "order"}, rows);
    return kExitSuccess;
}

int RunCommand(const AppConfig& config, const std::string& document_path,
               const OutputFormatter& formatter) {
    switch (config.command) {
        case Command::Resolve: return RunResolve(config, document_path, formatter);
        case Command::Check:   return RunCheck(config, document_path, formatter);
        case Command::Graph:   return RunGraph(config, document_path, formatter);
    }
    return RunResolve(config, document_path, formatter);
}

} // namespace cfgref
