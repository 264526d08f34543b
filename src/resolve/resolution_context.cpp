#include <cfgref/resolve/resolution_context.hpp>

#include <cfgref/value/leaf_path.hpp>

namespace cfgref {

namespace {

Error ContextError(const std::string& path, std::string message) {
    Error error;
    error.operation = "ResolutionContext";
    error.path = path;
    error.message = std::move(message);
    error.category = ErrorCategory::Internal;
    return error;
}

} // anonymous namespace

ResolutionContext::ResolutionContext(ConfigValue tree)
    : tree_(std::move(tree)) {}

const ConfigValue* ResolutionContext::Lookup(std::string_view path) const {
    return LookupPath(tree_, path);
}

Result<void, Error> ResolutionContext::Commit(const std::string& path, ConfigValue value) {
    if (IsCommitted(path)) {
        return Result<void, Error>::Err(
            ContextError(path, "node was already resolved"));
    }
    ConfigValue* slot = LookupPath(tree_, path);
    if (slot == nullptr) {
        return Result<void, Error>::Err(
            ContextError(path, "node is not part of the document"));
    }
    *slot = std::move(value);
    committed_.insert(path);
    return Result<void, Error>::Ok();
}

bool ResolutionContext::IsCommitted(std::string_view path) const {
    return committed_.find(path) != committed_.end();
}

} // namespace cfgref
