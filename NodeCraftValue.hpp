// NodeCraft value model
//
// Two representations of data flowing through a graph:
// - TaggedValue: a closed variant of the literal types a user can type into a
//   node input. Hashable (for version stamps) and printable.
// - Value: the type-erased payload carried along edges at evaluation time. It
//   holds an immutable, reference-counted payload plus its TypeDescriptor, so
//   fanning one output out to many inputs never copies the payload.
#pragma once
#include "NodeCraftError.hpp"
#include "NodeCraftTypes.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace NodeCraft {

struct DVec2 {
    double x = 0.0;
    double y = 0.0;
    bool operator==(const DVec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const DVec2& o) const { return !(*this == o); }
};

struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

struct Raster {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<Color> pixels; // row-major, width * height
    bool operator==(const Raster& o) const { return width == o.width && height == o.height && pixels == o.pixels; }
    bool operator!=(const Raster& o) const { return !(*this == o); }
};

using None = std::monostate;
using F64Array = std::vector<double>;
using PathPoints = std::vector<DVec2>;

template <> struct TypeNameOf<None> { static const char* name() { return TypeNames::None; } };
template <> struct TypeNameOf<bool> { static const char* name() { return TypeNames::Bool; } };
template <> struct TypeNameOf<std::uint32_t> { static const char* name() { return TypeNames::U32; } };
template <> struct TypeNameOf<std::uint64_t> { static const char* name() { return TypeNames::U64; } };
template <> struct TypeNameOf<double> { static const char* name() { return TypeNames::F64; } };
template <> struct TypeNameOf<std::string> { static const char* name() { return TypeNames::String; } };
template <> struct TypeNameOf<DVec2> { static const char* name() { return TypeNames::Vec2; } };
template <> struct TypeNameOf<Color> { static const char* name() { return TypeNames::Color; } };
template <> struct TypeNameOf<F64Array> { static const char* name() { return TypeNames::F64Array; } };
template <> struct TypeNameOf<PathPoints> { static const char* name() { return TypeNames::Path; } };
template <> struct TypeNameOf<Raster> { static const char* name() { return TypeNames::Raster; } };

// Literal value stored on an unconnected node input.
class TaggedValue {
public:
    using Storage = std::variant<None, bool, std::uint32_t, std::uint64_t, double, std::string, DVec2, Color,
                                 F64Array, PathPoints, Raster>;

    TaggedValue() = default;
    template <typename T, typename = std::enable_if_t<std::is_constructible_v<Storage, T&&> &&
                                                      !std::is_same_v<std::decay_t<T>, TaggedValue>>>
    TaggedValue(T&& value) : storage(std::forward<T>(value)) {}

    const Storage& variant() const { return storage; }
    template <typename T> bool holds() const { return std::holds_alternative<T>(storage); }
    template <typename T> const T* tryGet() const { return std::get_if<T>(&storage); }

    Type type() const;
    // Stable across runs and platforms: floating point values hash by bit
    // pattern, containers hash element-wise.
    std::uint64_t hash() const;

    // Display form. Colors print as #rrggbbaa, which rounds each channel to
    // a byte; flow documents store the float channels instead.
    std::string toPrimitiveString() const;
    static std::optional<TaggedValue> fromPrimitiveString(const std::string& text, const Type& type);
    // Default value for a concrete type, nullopt for generic or unknown types.
    static std::optional<TaggedValue> fromType(const Type& type);

    bool operator==(const TaggedValue& other) const { return storage == other.storage; }
    bool operator!=(const TaggedValue& other) const { return !(*this == other); }

private:
    Storage storage;
};

class Value {
public:
    Value() = default;

    template <typename T>
    static Value make(T value) {
        using U = std::decay_t<T>;
        return Value(std::make_shared<const U>(std::move(value)), &typeOf<U>());
    }
    static Value fromTagged(const TaggedValue& tagged);

    bool empty() const { return !payload; }
    const TypeDescriptor& descriptor() const { return type ? *type : typeOf<None>(); }
    const std::string& typeName() const { return descriptor().name; }
    Type concreteType() const { return Type::concrete(typeName()); }

    template <typename T>
    bool holds() const {
        return type == &typeOf<T>();
    }

    template <typename T>
    const T* tryGet() const {
        if (!holds<T>()) return nullptr;
        return static_cast<const T*>(payload.get());
    }

    template <typename T>
    const T& get() const {
        if (const T* p = tryGet<T>()) return *p;
        throwMismatch(typeOf<T>().name);
    }

    std::optional<TaggedValue> toTagged() const;
    std::string toDisplayString() const;
    // Same payload object, not just an equal payload.
    bool sharesPayloadWith(const Value& other) const { return payload && payload == other.payload; }
    long useCount() const { return payload.use_count(); }

private:
    Value(std::shared_ptr<const void> p, const TypeDescriptor* t) : payload(std::move(p)), type(t) {}
    [[noreturn]] void throwMismatch(const std::string& expected) const;

    std::shared_ptr<const void> payload;
    const TypeDescriptor* type = nullptr;
};

bool approximatelyEqual(const Value& a, const Value& b, double tolerance = 1e-9);

} // namespace NodeCraft
