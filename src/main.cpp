#include <cfgref/cli/commands.hpp>
#include <cfgref/cli/output_formatter.hpp>
#include <cfgref/config/config_loader.hpp>
#include <cfgref/core/log.hpp>
#include <cfgref/core/terminal.hpp>
#include <cfgref/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

void PrintUsage(std::ostream& out) {
    out << "Usage: cfgref <command> [document] [options]\n"
           "\n"
           "Resolve {{ values.path }} references inside a YAML or JSON configuration\n"
           "document.\n"
           "\n"
           "Commands:\n"
           "  resolve   Print the document with every reference resolved\n"
           "  check     Resolve and report success or the first error\n"
           "  graph     Print the reference graph and resolution order\n"
           "\n"
           "Run 'cfgref <command> --help' for the options of a command.\n";
}

// --version before the command.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "cfgref " << cfgref::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// -h/--help before the command.
bool HandleHelpFlag(int argc, const char* const* argv) {
    if (argc < 2) {
        return false;
    }
    auto arg = std::string_view{argv[1]};
    if (arg == "-h" || arg == "--help") {
        PrintUsage(std::cout);
        return true;
    }
    return false;
}

// Whether --json appears anywhere, for errors raised before the CLI is parsed.
bool WantsJson(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

std::unique_ptr<cfgref::ILogSink> MakeLogSink(const cfgref::AppConfig& config) {
    using namespace cfgref;
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "cfgref: cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }
    if (config.log_format == LogFormat::Json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(UseColor(config.color, TerminalStream::Stderr));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace cfgref;

    if (argc == 1) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }
    if (HandleHelpFlag(argc, argv)) {
        return kExitSuccess;
    }

    // Step 1: Parse CLI args (argparse handles per-command --help).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        OutputFormatter formatter(WantsJson(argc, argv),
                                  UseColor(ColorMode::Auto, TerminalStream::Stderr));
        formatter.PrintError(cli_result.Error());
        if (!WantsJson(argc, argv)) {
            PrintUsage(std::cerr);
        }
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();
    InitGlobalLogger(MakeLogSink(cli_config), LogLevelFor(cli_config));

    OutputFormatter cli_formatter(cli_config.json_output,
                                  UseColor(cli_config.color, TerminalStream::Stdout));
    auto cli_valid = ValidateConfig(cli_config);
    if (cli_valid.IsErr()) {
        cli_formatter.PrintError(cli_valid.Error());
        return cli_valid.Error().ExitCode();
    }

    // Step 2: Find the document.
    auto located = LocateDocument(cli_config);
    if (located.IsErr()) {
        cli_formatter.PrintError(located.Error());
        return located.Error().ExitCode();
    }
    const auto document_path = std::move(located).Value();

    // Step 3: Settings file under the CLI values.
    auto merged = ApplySettingsFile(cli_config, document_path);
    if (merged.IsErr()) {
        cli_formatter.PrintError(merged.Error());
        return merged.Error().ExitCode();
    }
    auto config = std::move(merged).Value();
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        cli_formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }
    if (config.settings_path.has_value()) {
        InitGlobalLogger(MakeLogSink(config), LogLevelFor(config));
    }

    // Step 4: Run the command.
    LogDebug("cli", std::string("running '") + CommandName(config.command) + "' on " +
                        document_path);
    OutputFormatter formatter(config.json_output,
                              UseColor(config.color, TerminalStream::Stdout));
    return RunCommand(config, document_path, formatter);
}
