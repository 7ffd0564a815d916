// NodeCraft type system
//
// Identifiers shared by every layer plus the two notions of "type" the engine
// deals with: the declared/resolved Type that the graph and the compiler talk
// about (a name, possibly a generic parameter), and the TypeDescriptor that
// tags a runtime payload with its concrete C++ type.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace NodeCraft {

using NodeId = std::uint64_t;
// Identity of a node through inlined networks: root node id first.
using NodePath = std::vector<NodeId>;
using ProtoNodeId = std::uint64_t;
using Stamp = std::uint64_t;

std::string formatPath(const NodePath& path);

// Declared or resolved type of a port. An empty concrete name means "not
// declared" and is inferred by the compiler.
struct Type {
    enum class Kind { Concrete, Generic };
    Kind kind = Kind::Concrete;
    std::string name;

    static Type concrete(std::string name) { return Type{Kind::Concrete, std::move(name)}; }
    static Type generic(std::string name) { return Type{Kind::Generic, std::move(name)}; }
    static Type inferred() { return Type{}; }

    bool isGeneric() const { return kind == Kind::Generic; }
    bool isConcrete() const { return kind == Kind::Concrete && !name.empty(); }
    bool isInferred() const { return kind == Kind::Concrete && name.empty(); }
    std::string toString() const;

    bool operator==(const Type& other) const { return kind == other.kind && name == other.name; }
    bool operator!=(const Type& other) const { return !(*this == other); }
};

// Parses "f64" as concrete and "'T" as a generic parameter.
Type parseType(const std::string& text);

// Names of the concrete types the engine knows how to carry.
namespace TypeNames {
inline constexpr const char* None = "()";
inline constexpr const char* Bool = "bool";
inline constexpr const char* U32 = "u32";
inline constexpr const char* U64 = "u64";
inline constexpr const char* F64 = "f64";
inline constexpr const char* String = "string";
inline constexpr const char* Vec2 = "vec2";
inline constexpr const char* Color = "color";
inline constexpr const char* F64Array = "f64[]";
inline constexpr const char* Path = "vec2[]";
inline constexpr const char* Raster = "raster";
} // namespace TypeNames

// Runtime identity of a payload type.
struct TypeDescriptor {
    std::string name;
    std::type_index id;
};

template <typename T>
struct TypeNameOf;

// Descriptor for a registered payload type. The instance is unique per T, so
// descriptors can be compared by address.
template <typename T>
const TypeDescriptor& typeOf() {
    static const TypeDescriptor descriptor{TypeNameOf<T>::name(), std::type_index(typeid(T))};
    return descriptor;
}

// Descriptor registered under a concrete type name, if any.
const TypeDescriptor* findType(const std::string& name);
std::vector<std::string> knownTypeNames();

} // namespace NodeCraft
