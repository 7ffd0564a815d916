// NodeCraftTypes.cpp
//
// Type naming and node path formatting.
#include "NodeCraftTypes.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace NodeCraft {

std::string formatPath(const NodePath& path) {
    if (path.empty()) return "<root>";
    return fmt::format("{}", fmt::join(path, "/"));
}

std::string Type::toString() const {
    if (isGeneric()) return "'" + name;
    if (name.empty()) return "_";
    return name;
}

Type parseType(const std::string& text) {
    if (text.empty() || text == "_") return Type::inferred();
    if (text.front() == '\'') return Type::generic(text.substr(1));
    return Type::concrete(text);
}

} // namespace NodeCraft
