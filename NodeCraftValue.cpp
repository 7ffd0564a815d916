// NodeCraftValue.cpp
//
// Literal hashing/parsing/printing and the type-erased Value helpers.
#include "NodeCraftValue.hpp"
#include "NodeCraftHash.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>

namespace NodeCraft {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string stripSuffix(const std::string& s, const char* suffix) {
    const std::string suf(suffix);
    if (s.size() > suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0) return s.substr(0, s.size() - suf.size());
    return s;
}

std::optional<double> parseDouble(const std::string& text) {
    std::string t = trim(stripSuffix(trim(text), "_f64"));
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') return std::nullopt;
    return v;
}

std::optional<std::uint64_t> parseUnsigned(const std::string& text, const char* suffix, std::uint64_t maxValue) {
    std::string t = trim(stripSuffix(trim(text), suffix));
    if (t.empty() || !std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); })) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(t.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v > maxValue) return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

std::vector<std::string> splitList(std::string text) {
    text = trim(text);
    if (!text.empty() && text.front() == '[' && text.back() == ']') text = text.substr(1, text.size() - 2);
    std::vector<std::string> parts;
    if (trim(text).empty()) return parts;
    std::size_t start = 0;
    while (true) {
        auto comma = text.find(',', start);
        parts.push_back(trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return parts;
}

std::optional<DVec2> parseVec2(const std::string& text) {
    std::string t = trim(text);
    if (!t.empty() && t.front() == '(' && t.back() == ')') t = t.substr(1, t.size() - 2);
    auto parts = splitList(t);
    if (parts.size() != 2) return std::nullopt;
    auto x = parseDouble(parts[0]);
    auto y = parseDouble(parts[1]);
    if (!x || !y) return std::nullopt;
    return DVec2{*x, *y};
}

std::optional<Color> parseColor(const std::string& text) {
    std::string t = trim(text);
    if (t.size() >= 2 && t.front() == '"' && t.back() == '"') t = trim(t.substr(1, t.size() - 2));
    if (t.rfind("Color::", 0) == 0) {
        const std::string name = t.substr(7);
        if (name == "BLACK") return Color{0, 0, 0, 1};
        if (name == "WHITE") return Color{1, 1, 1, 1};
        if (name == "RED") return Color{1, 0, 0, 1};
        if (name == "GREEN") return Color{0, 1, 0, 1};
        if (name == "BLUE") return Color{0, 0, 1, 1};
        if (name == "YELLOW") return Color{1, 1, 0, 1};
        if (name == "CYAN") return Color{0, 1, 1, 1};
        if (name == "MAGENTA") return Color{1, 0, 1, 1};
        if (name == "TRANSPARENT") return Color{0, 0, 0, 0};
        return std::nullopt;
    }
    if (!t.empty() && t.front() == '#') t = t.substr(1);
    if (t.size() != 6 && t.size() != 8) return std::nullopt;
    if (!std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isxdigit(c); })) return std::nullopt;
    auto channel = [&](std::size_t i) { return static_cast<float>(std::strtoul(t.substr(i, 2).c_str(), nullptr, 16)) / 255.0f; };
    Color c{channel(0), channel(2), channel(4), 1.0f};
    if (t.size() == 8) c.a = channel(6);
    return c;
}

std::uint64_t hashColor(const Color& c, std::uint64_t h) {
    h = hashDouble(c.r, h);
    h = hashDouble(c.g, h);
    h = hashDouble(c.b, h);
    return hashDouble(c.a, h);
}

int toByte(float v) { return static_cast<int>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f)); }

} // namespace

Type TaggedValue::type() const {
    return std::visit([](const auto& v) { return Type::concrete(TypeNameOf<std::decay_t<decltype(v)>>::name()); }, storage);
}

std::uint64_t TaggedValue::hash() const {
    std::uint64_t h = hashU64(storage.index());
    return std::visit(Overloaded{
        [&](const None&) { return h; },
        [&](bool v) { return hashU64(v ? 1 : 0, h); },
        [&](std::uint32_t v) { return hashU64(v, h); },
        [&](std::uint64_t v) { return hashU64(v, h); },
        [&](double v) { return hashDouble(v, h); },
        [&](const std::string& v) { return hashString(v, h); },
        [&](const DVec2& v) { return hashDouble(v.y, hashDouble(v.x, h)); },
        [&](const Color& v) { return hashColor(v, h); },
        [&](const F64Array& v) {
            h = hashU64(v.size(), h);
            for (double d : v) h = hashDouble(d, h);
            return h;
        },
        [&](const PathPoints& v) {
            h = hashU64(v.size(), h);
            for (const auto& p : v) h = hashDouble(p.y, hashDouble(p.x, h));
            return h;
        },
        [&](const Raster& v) {
            h = hashU64(v.width, h);
            h = hashU64(v.height, h);
            for (const auto& c : v.pixels) h = hashColor(c, h);
            return h;
        },
    }, storage);
}

std::string TaggedValue::toPrimitiveString() const {
    return std::visit(Overloaded{
        [](const None&) { return std::string("()"); },
        [](bool v) { return std::string(v ? "true" : "false"); },
        [](std::uint32_t v) { return fmt::format("{}_u32", v); },
        [](std::uint64_t v) { return fmt::format("{}_u64", v); },
        [](double v) { return fmt::format("{}_f64", v); },
        [](const std::string& v) { return fmt::format("\"{}\"", v); },
        [](const DVec2& v) { return fmt::format("{}, {}", v.x, v.y); },
        [](const Color& v) { return fmt::format("#{:02x}{:02x}{:02x}{:02x}", toByte(v.r), toByte(v.g), toByte(v.b), toByte(v.a)); },
        [](const F64Array& v) { return fmt::format("[{}]", fmt::join(v, ", ")); },
        [](const PathPoints& v) {
            std::vector<std::string> points;
            for (const auto& p : v) points.push_back(fmt::format("({}, {})", p.x, p.y));
            return fmt::format("[{}]", fmt::join(points, ", "));
        },
        [](const Raster& v) { return fmt::format("raster({}x{})", v.width, v.height); },
    }, storage);
}

std::optional<TaggedValue> TaggedValue::fromPrimitiveString(const std::string& text, const Type& type) {
    if (!type.isConcrete()) return std::nullopt;
    const std::string& n = type.name;
    if (n == TypeNames::None) return TaggedValue(None{});
    if (n == TypeNames::String) {
        std::string t = text;
        if (t.size() >= 2 && t.front() == '"' && t.back() == '"') t = t.substr(1, t.size() - 2);
        return TaggedValue(std::move(t));
    }
    if (n == TypeNames::F64) {
        if (auto v = parseDouble(text)) return TaggedValue(*v);
        return std::nullopt;
    }
    if (n == TypeNames::U32) {
        if (auto v = parseUnsigned(text, "_u32", std::numeric_limits<std::uint32_t>::max())) return TaggedValue(static_cast<std::uint32_t>(*v));
        return std::nullopt;
    }
    if (n == TypeNames::U64) {
        if (auto v = parseUnsigned(text, "_u64", std::numeric_limits<std::uint64_t>::max())) return TaggedValue(*v);
        return std::nullopt;
    }
    if (n == TypeNames::Bool) {
        const std::string t = trim(text);
        if (t == "true") return TaggedValue(true);
        if (t == "false") return TaggedValue(false);
        return std::nullopt;
    }
    if (n == TypeNames::Vec2) {
        if (auto v = parseVec2(text)) return TaggedValue(*v);
        return std::nullopt;
    }
    if (n == TypeNames::Color) {
        if (auto v = parseColor(text)) return TaggedValue(*v);
        return std::nullopt;
    }
    if (n == TypeNames::F64Array) {
        F64Array values;
        for (const auto& part : splitList(text)) {
            auto v = parseDouble(part);
            if (!v) return std::nullopt;
            values.push_back(*v);
        }
        return TaggedValue(std::move(values));
    }
    return std::nullopt;
}

std::optional<TaggedValue> TaggedValue::fromType(const Type& type) {
    if (!type.isConcrete()) return std::nullopt;
    const std::string& n = type.name;
    if (n == TypeNames::None) return TaggedValue(None{});
    if (n == TypeNames::Bool) return TaggedValue(false);
    if (n == TypeNames::U32) return TaggedValue(std::uint32_t{0});
    if (n == TypeNames::U64) return TaggedValue(std::uint64_t{0});
    if (n == TypeNames::F64) return TaggedValue(0.0);
    if (n == TypeNames::String) return TaggedValue(std::string());
    if (n == TypeNames::Vec2) return TaggedValue(DVec2{});
    if (n == TypeNames::Color) return TaggedValue(Color{});
    if (n == TypeNames::F64Array) return TaggedValue(F64Array{});
    if (n == TypeNames::Path) return TaggedValue(PathPoints{});
    if (n == TypeNames::Raster) return TaggedValue(Raster{});
    return std::nullopt;
}

Value Value::fromTagged(const TaggedValue& tagged) {
    return std::visit([](const auto& v) { return Value::make(v); }, tagged.variant());
}

std::optional<TaggedValue> Value::toTagged() const {
    if (empty()) return TaggedValue(None{});
    if (auto v = tryGet<None>()) return TaggedValue(*v);
    if (auto v = tryGet<bool>()) return TaggedValue(*v);
    if (auto v = tryGet<std::uint32_t>()) return TaggedValue(*v);
    if (auto v = tryGet<std::uint64_t>()) return TaggedValue(*v);
    if (auto v = tryGet<double>()) return TaggedValue(*v);
    if (auto v = tryGet<std::string>()) return TaggedValue(*v);
    if (auto v = tryGet<DVec2>()) return TaggedValue(*v);
    if (auto v = tryGet<Color>()) return TaggedValue(*v);
    if (auto v = tryGet<F64Array>()) return TaggedValue(*v);
    if (auto v = tryGet<PathPoints>()) return TaggedValue(*v);
    if (auto v = tryGet<Raster>()) return TaggedValue(*v);
    return std::nullopt;
}

std::string Value::toDisplayString() const {
    if (auto tagged = toTagged()) {
        if (auto s = tagged->tryGet<std::string>()) return *s;
        if (auto d = tagged->tryGet<double>()) return fmt::format("{}", *d);
        if (auto u = tagged->tryGet<std::uint32_t>()) return fmt::format("{}", *u);
        if (auto u = tagged->tryGet<std::uint64_t>()) return fmt::format("{}", *u);
        return tagged->toPrimitiveString();
    }
    return fmt::format("<{}>", typeName());
}

void Value::throwMismatch(const std::string& expected) const {
    throw FlowError(ErrorKind::TypeMismatch, fmt::format("expected a value of type {}, found {}", expected, typeName()));
}

bool approximatelyEqual(const Value& a, const Value& b, double tolerance) {
    if (&a.descriptor() != &b.descriptor()) return false;
    if (auto x = a.tryGet<double>()) return std::fabs(*x - b.get<double>()) <= tolerance;
    if (auto x = a.tryGet<F64Array>()) {
        const auto& y = b.get<F64Array>();
        if (x->size() != y.size()) return false;
        for (std::size_t i = 0; i < x->size(); ++i)
            if (std::fabs((*x)[i] - y[i]) > tolerance) return false;
        return true;
    }
    auto ta = a.toTagged();
    auto tb = b.toTagged();
    return ta && tb && *ta == *tb;
}

const TypeDescriptor* findType(const std::string& name) {
    static const TypeDescriptor* const all[] = {
        &typeOf<None>(), &typeOf<bool>(), &typeOf<std::uint32_t>(), &typeOf<std::uint64_t>(),
        &typeOf<double>(), &typeOf<std::string>(), &typeOf<DVec2>(), &typeOf<Color>(),
        &typeOf<F64Array>(), &typeOf<PathPoints>(), &typeOf<Raster>(),
    };
    for (const auto* d : all)
        if (d->name == name) return d;
    return nullptr;
}

std::vector<std::string> knownTypeNames() {
    return {TypeNames::None, TypeNames::Bool, TypeNames::U32, TypeNames::U64, TypeNames::F64, TypeNames::String,
            TypeNames::Vec2, TypeNames::Color, TypeNames::F64Array, TypeNames::Path, TypeNames::Raster};
}

} // namespace NodeCraft
