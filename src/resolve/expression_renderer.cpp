#include <cfgref/resolve/expression_renderer.hpp>

namespace cfgref {

ExpressionRenderer::ExpressionRenderer(const FilterRegistry& registry)
    : registry_(registry) {}

Result<ConfigValue, Error> ExpressionRenderer::Evaluate(
    const ReferenceExpression& expression,
    const std::string& node_path,
    const ResolutionContext& context) const {
    const ConfigValue* target = context.Lookup(expression.path);
    if (target == nullptr) {
        return Result<ConfigValue, Error>::Err(Error::ReferenceNotFound(
            node_path, expression.path, expression.raw_text));
    }

    ConfigValue current = *target;
    for (const auto& call : expression.filters) {
        const FilterFunction* filter = registry_.Find(call.name);
        if (filter == nullptr) {
            return Result<ConfigValue, Error>::Err(Error::TemplateSyntax(
                "ExpressionRenderer", node_path, expression.raw_text,
                "unknown filter '" + call.name + "'"));
        }
        auto applied = (*filter)(current, call.args);
        if (applied.IsErr()) {
            return Result<ConfigValue, Error>::Err(Error::TemplateSyntax(
                "ExpressionRenderer", node_path, expression.raw_text,
                std::move(applied).Error()));
        }
        current = std::move(applied).Value();
    }
    return Result<ConfigValue, Error>::Ok(std::move(current));
}

Result<ConfigValue, Error> ExpressionRenderer::Render(const DependencyNode& node,
                                                      const ResolutionContext& context) const {
    if (node.expressions.size() == 1 && node.expressions.front().is_pure) {
        return Evaluate(node.expressions.front(), node.path, context);
    }

    std::string rendered;
    size_t cursor = 0;
    for (const auto& expression : node.expressions) {
        rendered.append(node.raw, cursor, expression.start_offset - cursor);

        auto value = Evaluate(expression, node.path, context);
        if (value.IsErr()) {
            return value;
        }
        std::string text;
        if (!Stringify(value.Value(), text)) {
            return Result<ConfigValue, Error>::Err(Error::NonStringifiable(
                node.path, expression.raw_text, KindName(value.Value().GetKind())));
        }
        rendered += text;
        cursor = expression.end_offset;
    }
    rendered.append(node.raw, cursor, std::string::npos);
    return Result<ConfigValue, Error>::Ok(ConfigValue(std::move(rendered)));
}

} // namespace cfgref
