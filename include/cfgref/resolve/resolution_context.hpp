#pragma once

#include <cfgref/core/result.hpp>
#include <cfgref/value/config_value.hpp>

#include <set>
#include <string>
#include <string_view>

namespace cfgref {

// ---------------------------------------------------------------------------
// ResolutionContext: the working copy of the document during one run.
//
// Lookups see the document with every committed node already replaced by
// its resolved value. A node is committed at most once; the caller's input
// tree is never touched.
// ---------------------------------------------------------------------------
class ResolutionContext {
public:
    explicit ResolutionContext(ConfigValue tree);

    // nullptr when the path does not exist in the document.
    [[nodiscard]] const ConfigValue* Lookup(std::string_view path) const;

    // Replace the value at path with its resolved value.
    Result<void, Error> Commit(const std::string& path, ConfigValue value);

    [[nodiscard]] bool IsCommitted(std::string_view path) const;
    [[nodiscard]] size_t CommittedCount() const noexcept { return committed_.size(); }

    [[nodiscard]] const ConfigValue& Tree() const noexcept { return tree_; }
    [[nodiscard]] ConfigValue Release() && { return std::move(tree_); }

private:
    ConfigValue tree_;
    std::set<std::string, std::less<>> committed_;
};

} // namespace cfgref
