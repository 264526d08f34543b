#include <catch2/catch_test_macros.hpp>

#include <cfgref/resolve/expression_renderer.hpp>
#include <cfgref/resolve/resolution_context.hpp>

#include <string>

using namespace cfgref;

namespace {

const FilterRegistry& Builtins() {
    static const FilterRegistry registry = FilterRegistry::WithBuiltins();
    return registry;
}

// Build the graph for a tree and return the node at path.
DependencyNode NodeAt(const ConfigValue& tree, const std::string& path) {
    auto graph = BuildReferenceGraph(tree, Delimiters{}, nullptr);
    REQUIRE(graph.IsOk());
    auto index = graph.Value().IndexOf(path);
    REQUIRE(index.has_value());
    return graph.Value().Node(*index);
}

Result<ConfigValue, Error> RenderAt(const ConfigValue& tree, const std::string& path) {
    ResolutionContext context(tree);
    ExpressionRenderer renderer(Builtins());
    return renderer.Render(NodeAt(tree, path), context);
}

ConfigValue RenderOk(const ConfigValue& tree, const std::string& path) {
    auto result = RenderAt(tree, path);
    REQUIRE(result.IsOk());
    return std::move(result).Value();
}

} // anonymous namespace

// ===========================================================================
// ResolutionContext
// ===========================================================================

TEST_CASE("ResolutionContext: lookup follows paths", "[context]") {
    ResolutionContext context(ConfigValue::Map{
        {"db", ConfigValue::Map{{"port", 5432}}},
        {"hosts", ConfigValue::List{"a", "b"}},
    });
    REQUIRE(context.Lookup("db.port") != nullptr);
    CHECK(*context.Lookup("db.port") == ConfigValue(5432));
    CHECK(*context.Lookup("hosts.1") == ConfigValue("b"));
    CHECK(context.Lookup("db.user") == nullptr);
    CHECK(context.Lookup("hosts.2") == nullptr);
}

TEST_CASE("ResolutionContext: committed values are visible to later lookups", "[context]") {
    ConfigValue original = ConfigValue::Map{{"a", "{{ values.b }}"}, {"b", 1}};
    ResolutionContext context(original);

    REQUIRE(context.Commit("a", ConfigValue(1)).IsOk());
    CHECK(*context.Lookup("a") == ConfigValue(1));
    CHECK(context.IsCommitted("a"));
    CHECK_FALSE(context.IsCommitted("b"));
    CHECK(context.CommittedCount() == 1);

    // The tree passed in is a copy; the caller's value is unchanged.
    CHECK(*original.Find("a") == ConfigValue("{{ values.b }}"));
}

TEST_CASE("ResolutionContext: a node is committed at most once", "[context]") {
    ResolutionContext context(ConfigValue::Map{{"a", "x"}});
    REQUIRE(context.Commit("a", ConfigValue("y")).IsOk());

    auto again = context.Commit("a", ConfigValue("z"));
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Internal);
    CHECK(again.Error().message == "node was already resolved");
    CHECK(*context.Lookup("a") == ConfigValue("y"));
}

TEST_CASE("ResolutionContext: commit to a missing path fails", "[context]") {
    ResolutionContext context(ConfigValue::MakeMap());
    auto result = context.Commit("nowhere", ConfigValue(1));
    REQUIRE(result.IsErr());
    CHECK(result.Error().path == "nowhere");
    CHECK(result.Error().message == "node is not part of the document");
}

TEST_CASE("ResolutionContext: release hands back the working tree", "[context]") {
    ResolutionContext context(ConfigValue::Map{{"a", "x"}});
    REQUIRE(context.Commit("a", ConfigValue(true)).IsOk());
    auto tree = std::move(context).Release();
    CHECK(tree == ConfigValue(ConfigValue::Map{{"a", true}}));
}

// ===========================================================================
// Pure expressions
// ===========================================================================

TEST_CASE("ExpressionRenderer: pure expression keeps the referenced type", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"port", 8080},
        {"ratio", 0.5},
        {"debug", true},
        {"nothing", nullptr},
        {"hosts", ConfigValue::List{"a", "b"}},
        {"p", "{{ values.port }}"},
        {"r", "{{ values.ratio }}"},
        {"d", "{{ values.debug }}"},
        {"n", "{{ values.nothing }}"},
        {"h", "{{ values.hosts }}"},
    };
    CHECK(RenderOk(tree, "p") == ConfigValue(8080));
    CHECK(RenderOk(tree, "r") == ConfigValue(0.5));
    CHECK(RenderOk(tree, "d") == ConfigValue(true));
    CHECK(RenderOk(tree, "n") == ConfigValue());
    CHECK(RenderOk(tree, "h") == ConfigValue(ConfigValue::List{"a", "b"}));
}

TEST_CASE("ExpressionRenderer: surrounding whitespace does not make an expression impure", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{{"port", 8080}, {"p", "  {{ values.port }} "}};
    CHECK(RenderOk(tree, "p") == ConfigValue(8080));
}

TEST_CASE("ExpressionRenderer: filters apply to a pure expression", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"name", "My-App"},
        {"port", "8080"},
        {"n", "{{ values.name | lower | replace('-', '_') }}"},
        {"p", "{{ values.port | int }}"},
    };
    CHECK(RenderOk(tree, "n") == ConfigValue("my_app"));
    CHECK(RenderOk(tree, "p") == ConfigValue(8080));
}

// ===========================================================================
// Interpolation
// ===========================================================================

TEST_CASE("ExpressionRenderer: interpolation stringifies scalars", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"host", "db"},
        {"port", 5432},
        {"ssl", false},
        {"weight", 1.5},
        {"none", nullptr},
        {"url", "postgres://{{ values.host }}:{{ values.port }}/?ssl={{ values.ssl }}"},
        {"w", "w={{ values.weight }}"},
        {"z", "[{{ values.none }}]"},
    };
    CHECK(RenderOk(tree, "url") == ConfigValue("postgres://db:5432/?ssl=false"));
    CHECK(RenderOk(tree, "w") == ConfigValue("w=1.5"));
    CHECK(RenderOk(tree, "z") == ConfigValue("[null]"));
}

TEST_CASE("ExpressionRenderer: two pure-looking expressions render as a string", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{{"a", 1}, {"b", 2}, {"c", "{{ values.a }}{{ values.b }}"}};
    CHECK(RenderOk(tree, "c") == ConfigValue("12"));
}

TEST_CASE("ExpressionRenderer: interpolating a list fails", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"hosts", ConfigValue::List{"a"}},
        {"x", "hosts: {{ values.hosts }}"},
    };
    auto result = RenderAt(tree, "x");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NonStringifiableValue);
    CHECK(result.Error().path == "x");
    CHECK(result.Error().expression == std::optional<std::string>("{{ values.hosts }}"));
    CHECK(result.Error().message == "Cannot interpolate a list value into a string");
}

TEST_CASE("ExpressionRenderer: a filter can make a list interpolable", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"hosts", ConfigValue::List{"a", "b"}},
        {"x", "hosts: {{ values.hosts | join(',') }}"},
    };
    CHECK(RenderOk(tree, "x") == ConfigValue("hosts: a,b"));
}

// ===========================================================================
// Errors
// ===========================================================================

TEST_CASE("ExpressionRenderer: missing reference", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{{"a", "x-{{ values.missing.key }}"}};
    auto result = RenderAt(tree, "a");
    REQUIRE(result.IsErr());
    const auto& error = result.Error();
    CHECK(error.category == ErrorCategory::ReferenceNotFound);
    CHECK(error.path == "a");
    CHECK(error.expression == std::optional<std::string>("{{ values.missing.key }}"));
    CHECK(error.message == "Reference 'values.missing.key' not found");
}

TEST_CASE("ExpressionRenderer: failing filter is a template error", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{{"n", 3}, {"a", "{{ values.n | length }}"}};
    auto result = RenderAt(tree, "a");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::TemplateSyntax);
    CHECK(result.Error().operation == "ExpressionRenderer");
    CHECK(result.Error().message == "filter 'length' has no length for integer");
}

TEST_CASE("ExpressionRenderer: unknown filter is a template error", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{{"n", "x"}, {"a", "{{ values.n | shout }}"}};
    auto result = RenderAt(tree, "a");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::TemplateSyntax);
    CHECK(result.Error().message == "unknown filter 'shout'");
}

TEST_CASE("ExpressionRenderer: evaluation sees committed values", "[renderer]") {
    ConfigValue tree = ConfigValue::Map{
        {"base", "app"},
        {"name", "{{ values.base }}-svc"},
        {"url", "http://{{ values.name }}"},
    };
    ResolutionContext context(tree);
    REQUIRE(context.Commit("name", ConfigValue("app-svc")).IsOk());

    ExpressionRenderer renderer(Builtins());
    auto result = renderer.Render(NodeAt(tree, "url"), context);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == ConfigValue("http://app-svc"));
}
