#include <cfgref/value/leaf_path.hpp>

#include <cctype>

namespace cfgref {

namespace {

// Parse a list index segment. Rejects signs, leading '+' and empty text.
bool ParseIndex(std::string_view segment, size_t& index) {
    if (segment.empty() || segment.size() > 18) {
        return false;
    }
    size_t value = 0;
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    index = value;
    return true;
}

template <typename Value>
Value* Step(Value* current, std::string_view segment) {
    if (current->IsMap()) {
        return current->Find(segment);
    }
    if (current->IsList()) {
        size_t index = 0;
        if (!ParseIndex(segment, index) || index >= current->AsList().size()) {
            return nullptr;
        }
        return &current->AsList()[index];
    }
    return nullptr;
}

template <typename Value>
Value* Lookup(Value& root, std::string_view path) {
    Value* current = &root;
    if (path.empty()) {
        return current;
    }
    size_t start = 0;
    while (current != nullptr) {
        const auto dot = path.find('.', start);
        const auto segment = path.substr(
            start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        current = Step(current, segment);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return current;
}

void Walk(const ConfigValue& value, const std::string& path,
          const TreeVisitor& visit) {
    if (value.IsMap()) {
        for (const auto& entry : value.AsMap()) {
            const auto child = JoinPath(path, entry.first);
            visit(child, entry.second);
            Walk(entry.second, child, visit);
        }
    } else if (value.IsList()) {
        const auto& items = value.AsList();
        for (size_t i = 0; i < items.size(); ++i) {
            const auto child = JoinPath(path, std::to_string(i));
            visit(child, items[i]);
            Walk(items[i], child, visit);
        }
    }
}

} // anonymous namespace

std::string JoinPath(std::string_view parent, std::string_view segment) {
    if (parent.empty()) {
        return std::string(segment);
    }
    std::string joined;
    joined.reserve(parent.size() + 1 + segment.size());
    joined.append(parent);
    joined.push_back('.');
    joined.append(segment);
    return joined;
}

std::vector<std::string> SplitPath(std::string_view path) {
    std::vector<std::string> segments;
    if (path.empty()) {
        return segments;
    }
    size_t start = 0;
    while (true) {
        const auto dot = path.find('.', start);
        if (dot == std::string_view::npos) {
            segments.emplace_back(path.substr(start));
            break;
        }
        segments.emplace_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool IsSameOrDescendant(std::string_view path, std::string_view ancestor) {
    if (ancestor.empty()) {
        return true;
    }
    if (path.size() < ancestor.size() ||
        path.compare(0, ancestor.size(), ancestor) != 0) {
        return false;
    }
    return path.size() == ancestor.size() || path[ancestor.size()] == '.';
}

const ConfigValue* LookupPath(const ConfigValue& root, std::string_view path) {
    return Lookup(root, path);
}

ConfigValue* LookupPath(ConfigValue& root, std::string_view path) {
    return Lookup(root, path);
}

void WalkTree(const ConfigValue& root, const TreeVisitor& visit) {
    Walk(root, "", visit);
}

} // namespace cfgref
