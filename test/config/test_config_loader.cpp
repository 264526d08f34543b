#include <catch2/catch_test_macros.hpp>

#include <cfgref/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace cfgref;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests are run from the build directory; testdata is relative to project root.
// Use __FILE__ to get the absolute path of this test file and derive testdata path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);           // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

AppConfig ValidBase() {
    AppConfig config;
    config.document_path = "config.yml";
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full settings", "[config][yaml]") {
    const auto path = TestDataPath("valid_settings.yaml");
    auto result = LoadFromYaml(path);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.resolver.enabled);
    CHECK(config.resolver.max_depth == 4);
    CHECK(config.resolver.delimiters.open == "[[");
    CHECK(config.resolver.delimiters.close == "]]");
    REQUIRE(config.output_format.has_value());
    CHECK(*config.output_format == OutputFormat::Yaml);
    CHECK(config.color == ColorMode::Never);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/cfgref-test.log");
    REQUIRE(config.log_level.has_value());
    CHECK(*config.log_level == LogLevel::Debug);
    REQUIRE(config.settings_path.has_value());
    CHECK(*config.settings_path == path);
}

TEST_CASE("LoadFromYaml: minimal settings keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_settings.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.resolver.max_depth == 20);
    CHECK(config.resolver.enabled);
    CHECK(config.resolver.delimiters.open == "{{");
    CHECK(config.resolver.delimiters.close == "}}");
    CHECK_FALSE(config.output_format.has_value());
    CHECK(config.color == ColorMode::Auto);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.log_level.has_value());
}

TEST_CASE("LoadFromYaml: resolution can be switched off", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("disabled_settings.yaml"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().resolver.enabled);
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/settings.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().ExitCode() == 8);
}

TEST_CASE("LoadFromYaml: malformed file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_settings.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("Failed to read settings file: ", 0) == 0);
}

TEST_CASE("LoadFromYaml: unknown output format", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_format_settings.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Unknown output format 'xml' (expected json or yaml)");
}

TEST_CASE("LoadFromYaml: unknown log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_level_settings.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Unknown log level 'loud'");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: command and document", "[config][cli]") {
    const char* argv[] = {"cfgref", "resolve", "config.yml"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.command == Command::Resolve);
    REQUIRE(config.document_path.has_value());
    CHECK(*config.document_path == "config.yml");
    CHECK(config.resolver.enabled);
    CHECK(config.resolver.max_depth == kDefaultMaxDepth);
    CHECK_FALSE(config.output_format.has_value());
    CHECK(config.verbosity == 0);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromCli: every command is recognised", "[config][cli]") {
    for (auto command : {Command::Resolve, Command::Check, Command::Graph}) {
        const char* argv[] = {"cfgref", CommandName(command), "doc.json"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsOk());
        CHECK(result.Value().command == command);
    }
}

TEST_CASE("LoadFromCli: missing command", "[config][cli]") {
    const char* argv[] = {"cfgref"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing command (expected resolve, check or graph)");
}

TEST_CASE("LoadFromCli: unknown command", "[config][cli]") {
    const char* argv[] = {"cfgref", "render", "doc.yml"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message == "Unknown command 'render' (expected resolve, check or graph)");
}

TEST_CASE("LoadFromCli: resolver flags", "[config][cli]") {
    const char* argv[] = {
        "cfgref", "check", "doc.yml",
        "--max-depth", "3",
        "--open", "<%",
        "--close", "%>",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& resolver = result.Value().resolver;
    CHECK(resolver.max_depth == 3);
    CHECK(resolver.delimiters.open == "<%");
    CHECK(resolver.delimiters.close == "%>");
}

TEST_CASE("LoadFromCli: no-resolve-refs flag", "[config][cli]") {
    const char* argv[] = {"cfgref", "resolve", "doc.yml", "--no-resolve-refs"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().resolver.enabled);
}

TEST_CASE("LoadFromCli: project and settings", "[config][cli]") {
    const char* argv[] = {"cfgref", "graph", "-p", "/srv/app", "-s", "/etc/cfgref.yaml"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK_FALSE(config.document_path.has_value());
    REQUIRE(config.project_dir.has_value());
    CHECK(*config.project_dir == "/srv/app");
    REQUIRE(config.settings_path.has_value());
    CHECK(*config.settings_path == "/etc/cfgref.yaml");
}

TEST_CASE("LoadFromCli: output format", "[config][cli]") {
    const char* yaml_argv[] = {"cfgref", "resolve", "doc.json", "--format", "yml"};
    auto yaml = LoadFromCli(5, yaml_argv);
    REQUIRE(yaml.IsOk());
    CHECK(yaml.Value().output_format == std::optional<OutputFormat>(OutputFormat::Yaml));

    const char* bad_argv[] = {"cfgref", "resolve", "doc.json", "-f", "toml"};
    auto bad = LoadFromCli(5, bad_argv);
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().message == "Invalid --format 'toml' (expected json or yaml)");
}

TEST_CASE("LoadFromCli: output options", "[config][cli]") {
    const char* argv[] = {
        "cfgref", "check", "doc.yml",
        "--json", "--no-color",
        "--log-file", "/tmp/cfgref.log",
        "--log-format", "json",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.json_output);
    CHECK(config.color == ColorMode::Never);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/cfgref.log");
    CHECK(config.log_format == LogFormat::Json);
}

TEST_CASE("LoadFromCli: invalid log format", "[config][cli]") {
    const char* argv[] = {"cfgref", "check", "doc.yml", "--log-format", "xml"};
    auto result = LoadFromCli(5, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Invalid --log-format 'xml' (expected text or json)");
}

TEST_CASE("LoadFromCli: verbosity counts repeated flags", "[config][cli]") {
    const char* once[] = {"cfgref", "check", "doc.yml", "-v"};
    auto one = LoadFromCli(4, once);
    REQUIRE(one.IsOk());
    CHECK(one.Value().verbosity == 1);

    const char* twice[] = {"cfgref", "check", "doc.yml", "-v", "--verbose"};
    auto two = LoadFromCli(5, twice);
    REQUIRE(two.IsOk());
    CHECK(two.Value().verbosity == 2);
}

TEST_CASE("LoadFromCli: quiet flag", "[config][cli]") {
    const char* argv[] = {"cfgref", "check", "doc.yml", "-q"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().quiet);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"cfgref", "resolve", "doc.yml", "--frobnicate"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.rfind("CLI parse error: ", 0) == 0);
}

TEST_CASE("LoadFromCli: non-numeric max depth", "[config][cli]") {
    const char* argv[] = {"cfgref", "resolve", "doc.yml", "--max-depth", "deep"};
    auto result = LoadFromCli(5, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides settings", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_settings.yaml"));
    REQUIRE(yaml_result.IsOk());

    AppConfig cli;
    cli.command = Command::Graph;
    cli.document_path = "doc.yml";
    cli.resolver.max_depth = 7;
    cli.output_format = OutputFormat::Json;
    cli.color = ColorMode::Always;

    auto merged = MergeConfigs(yaml_result.Value(), cli);
    CHECK(merged.command == Command::Graph);
    CHECK(merged.document_path == std::optional<std::string>("doc.yml"));
    CHECK(merged.resolver.max_depth == 7);
    CHECK(merged.output_format == std::optional<OutputFormat>(OutputFormat::Json));
    CHECK(merged.color == ColorMode::Always);
    // Not given on the command line: the settings file wins.
    CHECK(merged.resolver.delimiters.open == "[[");
    CHECK(merged.resolver.delimiters.close == "]]");
    CHECK(merged.log_level == std::optional<LogLevel>(LogLevel::Debug));
    CHECK(merged.log_file == std::optional<std::string>("/tmp/cfgref-test.log"));
}

TEST_CASE("MergeConfigs: defaults on the CLI keep settings values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("minimal_settings.yaml"));
    REQUIRE(yaml_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), AppConfig{});
    CHECK(merged.resolver.max_depth == 20);
    CHECK(merged.resolver.enabled);
}

TEST_CASE("MergeConfigs: CLI can disable resolution", "[config][merge]") {
    AppConfig cli;
    cli.resolver.enabled = false;
    cli.quiet = true;

    auto merged = MergeConfigs(AppConfig{}, cli);
    CHECK_FALSE(merged.resolver.enabled);
    CHECK(merged.quiet);
}

TEST_CASE("MergeConfigs: settings file can disable resolution", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("disabled_settings.yaml"));
    REQUIRE(yaml_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), AppConfig{});
    CHECK_FALSE(merged.resolver.enabled);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(ValidBase()).IsOk());

    AppConfig project;
    project.project_dir = "/srv/app";
    CHECK(ValidateConfig(project).IsOk());
}

TEST_CASE("ValidateConfig: document or project is required", "[config][validate]") {
    auto result = ValidateConfig(AppConfig{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Missing document: pass a file or --project <dir>");
}

TEST_CASE("ValidateConfig: document and project are exclusive", "[config][validate]") {
    auto config = ValidBase();
    config.project_dir = "/srv/app";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Cannot use both a document path and --project");
}

TEST_CASE("ValidateConfig: max depth must be positive", "[config][validate]") {
    auto config = ValidBase();
    config.resolver.max_depth = 0;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Maximum depth must be at least 1, got 0");
}

TEST_CASE("ValidateConfig: delimiters", "[config][validate]") {
    auto empty = ValidBase();
    empty.resolver.delimiters.close = "";
    CHECK(ValidateConfig(empty).IsErr());

    auto same = ValidBase();
    same.resolver.delimiters.open = "%%";
    same.resolver.delimiters.close = "%%";
    auto result = ValidateConfig(same);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Opening and closing delimiters must differ");
}

TEST_CASE("ValidateConfig: verbose and quiet conflict", "[config][validate]") {
    auto config = ValidBase();
    config.verbosity = 1;
    config.quiet = true;
    CHECK(ValidateConfig(config).IsErr());
}

// ===========================================================================
// LogLevelFor
// ===========================================================================

TEST_CASE("LogLevelFor: flags beat the settings file", "[config][log]") {
    AppConfig config;
    CHECK(LogLevelFor(config) == LogLevel::Warn);

    config.log_level = LogLevel::Error;
    CHECK(LogLevelFor(config) == LogLevel::Error);

    config.verbosity = 1;
    CHECK(LogLevelFor(config) == LogLevel::Info);

    config.verbosity = 2;
    CHECK(LogLevelFor(config) == LogLevel::Debug);

    config.verbosity = 0;
    config.quiet = true;
    CHECK(LogLevelFor(config) == LogLevel::Error);
}
