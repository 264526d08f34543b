#include <cfgref/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iterator>
#include <sstream>

namespace cfgref {

Error Error::TemplateSyntax(std::string operation, std::string path,
                            std::optional<std::string> expression,
                            std::string message) {
    Error error;
    error.operation = std::move(operation);
    error.path = std::move(path);
    error.expression = std::move(expression);
    error.message = std::move(message);
    error.category = ErrorCategory::TemplateSyntax;
    return error;
}

Error Error::CircularDependency(std::vector<std::string> cycle) {
    Error error;
    error.operation = "CycleDetector";
    error.path = cycle.empty() ? "" : cycle.front();
    error.cycle = std::move(cycle);
    error.message = "Circular dependency detected: " + error.CycleString();
    error.category = ErrorCategory::CircularDependency;
    return error;
}

Error Error::ReferenceNotFound(std::string path, std::string missing,
                               std::optional<std::string> expression) {
    Error error;
    error.operation = "ExpressionRenderer";
    error.path = std::move(path);
    error.expression = std::move(expression);
    error.message = "Reference 'values." + missing + "' not found";
    error.category = ErrorCategory::ReferenceNotFound;
    return error;
}

Error Error::MaxDepthExceeded(std::string path, int depth, int max_depth) {
    Error error;
    error.operation = "DepthGuard";
    error.path = std::move(path);
    error.depth = depth;
    error.message = "Dependency chain of length " + std::to_string(depth) +
                    " exceeds the maximum of " + std::to_string(max_depth);
    error.category = ErrorCategory::MaxDepthExceeded;
    return error;
}

Error Error::NonStringifiable(std::string path, std::string expression,
                              std::string type_name) {
    Error error;
    error.operation = "ExpressionRenderer";
    error.path = std::move(path);
    error.expression = std::move(expression);
    error.message = "Cannot interpolate a " + type_name +
                    " value into a string";
    error.category = ErrorCategory::NonStringifiableValue;
    return error;
}

namespace {

struct CategoryInfo {
    ErrorCategory category;
    const char* name;
    int exit_code;
};

constexpr CategoryInfo kCategories[] = {
    {ErrorCategory::TemplateSyntax,        "template_syntax",         2},
    {ErrorCategory::CircularDependency,    "circular_dependency",     3},
    {ErrorCategory::ReferenceNotFound,     "reference_not_found",     4},
    {ErrorCategory::MaxDepthExceeded,      "max_depth_exceeded",      5},
    {ErrorCategory::NonStringifiableValue, "non_stringifiable_value", 6},
    {ErrorCategory::DocumentLoad,          "document_load",           7},
    {ErrorCategory::Config,                "config",                  8},
    {ErrorCategory::Internal,              "internal",                99},
};

const CategoryInfo& InfoFor(ErrorCategory category) {
    for (const auto& info : kCategories) {
        if (info.category == category) {
            return info;
        }
    }
    return kCategories[std::size(kCategories) - 1];
}

} // namespace

int Error::ExitCode() const {
    return InfoFor(category).exit_code;
}

std::string Error::CategoryName() const {
    return InfoFor(category).name;
}

std::string Error::CycleString() const {
    std::string out;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            out += " → ";
        }
        out += cycle[i];
    }
    return out;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    if (expression.has_value() && !expression->empty()) {
        oss << " (in '" << *expression << "')";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::ordered_json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!path.empty()) {
        body["path"] = path;
    }
    if (expression.has_value()) {
        body["expression"] = *expression;
    }
    body["message"] = message;
    if (!cycle.empty()) {
        body["cycle"] = cycle;
    }
    if (depth.has_value()) {
        body["depth"] = *depth;
    }
    body["exit_code"] = ExitCode();

    nlohmann::ordered_json root;
    root["error"] = std::move(body);
    return root.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace cfgref
