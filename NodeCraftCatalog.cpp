// NodeCraftCatalog.cpp
//
// Overload resolution (generic parameter binding) and the built-in operation
// set.
#include "NodeCraftCatalog.hpp"
#include "NodeCraftError.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

namespace NodeCraft {

const char* gpuOpcodeName(GpuOpcode op) {
    switch (op) {
        case GpuOpcode::Identity: return "identity";
        case GpuOpcode::Add: return "add";
        case GpuOpcode::Subtract: return "subtract";
        case GpuOpcode::Multiply: return "multiply";
        case GpuOpcode::Divide: return "divide";
        case GpuOpcode::Negate: return "negate";
        case GpuOpcode::Double: return "double";
        case GpuOpcode::Min: return "min";
        case GpuOpcode::Max: return "max";
    }
    return "unknown";
}

std::size_t gpuOpcodeArity(GpuOpcode op) {
    switch (op) {
        case GpuOpcode::Identity:
        case GpuOpcode::Negate:
        case GpuOpcode::Double:
            return 1;
        default:
            return 2;
    }
}

std::string OperationSignature::toString() const {
    std::vector<std::string> names;
    for (const auto& t : inputs) names.push_back(t.toString());
    return fmt::format("({}) -> {}", fmt::join(names, ", "), output.toString());
}

std::size_t OperationSignature::specificity() const {
    return static_cast<std::size_t>(std::count_if(inputs.begin(), inputs.end(), [](const Type& t) { return t.isConcrete(); }));
}

std::string Operation::instanceName(const std::vector<Type>& inputTypes) const {
    std::vector<std::string> names;
    for (const auto& t : inputTypes) names.push_back(t.toString());
    return fmt::format("{}<{}>", identifier, fmt::join(names, ","));
}

const char* overloadPolicyName(OverloadPolicy policy) {
    switch (policy) {
        case OverloadPolicy::MostSpecific: return "most-specific";
        case OverloadPolicy::DeclarationOrder: return "declaration-order";
        case OverloadPolicy::Strict: return "strict";
    }
    return "unknown";
}

std::optional<OverloadPolicy> parseOverloadPolicy(const std::string& name) {
    if (name == "most-specific") return OverloadPolicy::MostSpecific;
    if (name == "declaration-order") return OverloadPolicy::DeclarationOrder;
    if (name == "strict") return OverloadPolicy::Strict;
    return std::nullopt;
}

const Operation& OperationCatalog::registerOperation(const std::string& identifier, OperationSignature signature, CpuKernel cpu,
                                                     std::optional<GpuOpcode> gpu) {
    if (!cpu && !gpu) throw std::invalid_argument(fmt::format("Operation {} has neither a CPU nor a GPU kernel", identifier));
    if (gpu && gpuOpcodeArity(*gpu) != signature.inputs.size())
        throw std::invalid_argument(fmt::format("Operation {} does not match the arity of GPU opcode {}", identifier, gpuOpcodeName(*gpu)));
    auto op = std::make_unique<Operation>();
    op->identifier = identifier;
    op->signature = std::move(signature);
    op->cpu = std::move(cpu);
    op->gpu = gpu;
    op->declarationOrder = declared++;
    auto& list = operations[identifier];
    list.push_back(std::move(op));
    return *list.back();
}

const Operation& OperationCatalog::registerLiteralOperation(const std::string& identifier) {
    registerOperation(identifier, {{Type::generic("T")}, Type::generic("T")}, [](const std::vector<Value>& in) { return in.at(0); });
    Operation& op = *operations[identifier].back();
    op.literal = true;
    return op;
}

std::vector<const Operation*> OperationCatalog::overloads(const std::string& identifier) const {
    std::vector<const Operation*> out;
    auto it = operations.find(identifier);
    if (it == operations.end()) return out;
    for (const auto& op : it->second) out.push_back(op.get());
    return out;
}

std::size_t OperationCatalog::size() const {
    std::size_t n = 0;
    for (const auto& [id, list] : operations) n += list.size();
    return n;
}

namespace {

// Binds generic parameters of `sig` against `args`. Returns the bound output
// type, or nullopt when the overload does not apply.
std::optional<Type> unify(const OperationSignature& sig, const std::vector<Type>& args) {
    if (sig.inputs.size() != args.size()) return std::nullopt;
    std::map<std::string, Type> bindings;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const Type& param = sig.inputs[i];
        const Type& arg = args[i];
        if (!arg.isConcrete()) return std::nullopt;
        if (param.isGeneric()) {
            auto [it, inserted] = bindings.emplace(param.name, arg);
            if (!inserted && it->second != arg) return std::nullopt;
        } else if (param != arg) {
            return std::nullopt;
        }
    }
    if (sig.output.isGeneric()) {
        auto it = bindings.find(sig.output.name);
        if (it == bindings.end()) return std::nullopt;
        return it->second;
    }
    return sig.output;
}

std::string describeArgs(const std::vector<Type>& args) {
    std::vector<std::string> names;
    for (const auto& t : args) names.push_back(t.toString());
    return fmt::format("({})", fmt::join(names, ", "));
}

} // namespace

Resolution OperationCatalog::resolve(const std::string& identifier, const std::vector<Type>& argTypes, OverloadPolicy policy) const {
    auto it = operations.find(identifier);
    if (it == operations.end()) throw FlowError(ErrorKind::TypeResolutionError, fmt::format("unknown operation '{}'", identifier));

    struct Candidate {
        const Operation* op;
        Type output;
    };
    std::vector<Candidate> matches;
    for (const auto& op : it->second) {
        if (auto out = unify(op->signature, argTypes)) matches.push_back({op.get(), *out});
    }
    if (matches.empty()) {
        std::vector<std::string> sigs;
        for (const auto& op : it->second) sigs.push_back(op->signature.toString());
        throw FlowError(ErrorKind::TypeResolutionError,
                        fmt::format("no overload of '{}' accepts {}; candidates: {}", identifier, describeArgs(argTypes), fmt::join(sigs, "; ")));
    }

    // Registration order is preserved in `matches`.
    const Candidate* chosen = &matches.front();
    if (policy != OverloadPolicy::DeclarationOrder) {
        std::size_t best = 0;
        for (const auto& c : matches) best = std::max(best, c.op->signature.specificity());
        std::vector<const Candidate*> top;
        for (const auto& c : matches)
            if (c.op->signature.specificity() == best) top.push_back(&c);
        if (top.size() > 1 && policy == OverloadPolicy::Strict) {
            std::vector<std::string> sigs;
            for (const auto* c : top) sigs.push_back(c->op->signature.toString());
            throw FlowError(ErrorKind::AmbiguousOverload,
                            fmt::format("'{}' is ambiguous for {}: {}", identifier, describeArgs(argTypes), fmt::join(sigs, "; ")));
        }
        chosen = top.front();
    }
    return Resolution{chosen->op, argTypes, chosen->output};
}

// ---------------------------------------------------------------- builtins

namespace {

const Type F64T = Type::concrete(TypeNames::F64);
const Type U32T = Type::concrete(TypeNames::U32);
const Type ArrayT = Type::concrete(TypeNames::F64Array);
const Type Vec2T = Type::concrete(TypeNames::Vec2);
const Type PathT = Type::concrete(TypeNames::Path);
const Type ColorT = Type::concrete(TypeNames::Color);
const Type RasterT = Type::concrete(TypeNames::Raster);
const Type StringT = Type::concrete(TypeNames::String);
const Type GenericT = Type::generic("T");

template <typename Fn>
CpuKernel scalarBinary(Fn fn) {
    return [fn](const std::vector<Value>& in) { return Value::make(fn(in.at(0).get<double>(), in.at(1).get<double>())); };
}

template <typename Fn>
CpuKernel arrayBinary(Fn fn) {
    return [fn](const std::vector<Value>& in) {
        const auto& a = in.at(0).get<F64Array>();
        const auto& b = in.at(1).get<F64Array>();
        if (a.size() != b.size()) throw std::invalid_argument(fmt::format("array lengths differ ({} vs {})", a.size(), b.size()));
        F64Array out(a.size());
        for (std::size_t i = 0; i < a.size(); ++i) out[i] = fn(a[i], b[i]);
        return Value::make(std::move(out));
    };
}

template <typename Fn>
CpuKernel arrayScalar(Fn fn) {
    return [fn](const std::vector<Value>& in) {
        const auto& a = in.at(0).get<F64Array>();
        const double b = in.at(1).get<double>();
        F64Array out(a.size());
        for (std::size_t i = 0; i < a.size(); ++i) out[i] = fn(a[i], b);
        return Value::make(std::move(out));
    };
}

template <typename Fn>
CpuKernel arrayUnary(Fn fn) {
    return [fn](const std::vector<Value>& in) {
        const auto& a = in.at(0).get<F64Array>();
        F64Array out(a.size());
        for (std::size_t i = 0; i < a.size(); ++i) out[i] = fn(a[i]);
        return Value::make(std::move(out));
    };
}

template <typename Fn>
void registerArithmetic(OperationCatalog& catalog, const std::string& id, GpuOpcode opcode, Fn fn) {
    catalog.registerOperation(id, {{F64T, F64T}, F64T}, scalarBinary(fn), opcode);
    catalog.registerOperation(id, {{ArrayT, ArrayT}, ArrayT}, arrayBinary(fn), opcode);
    catalog.registerOperation(id, {{ArrayT, F64T}, ArrayT}, arrayScalar(fn), opcode);
}

double luminance(const Color& c) { return 0.2126 * c.r + 0.7152 * c.g + 0.0722 * c.b; }

} // namespace

void registerBuiltinOperations(OperationCatalog& catalog) {
    catalog.registerLiteralOperation(kValueOperation);
    catalog.registerOperation("core::identity", {{GenericT}, GenericT}, [](const std::vector<Value>& in) { return in.at(0); }, GpuOpcode::Identity);

    registerArithmetic(catalog, "math::add", GpuOpcode::Add, [](double a, double b) { return a + b; });
    registerArithmetic(catalog, "math::subtract", GpuOpcode::Subtract, [](double a, double b) { return a - b; });
    registerArithmetic(catalog, "math::multiply", GpuOpcode::Multiply, [](double a, double b) { return a * b; });
    registerArithmetic(catalog, "math::divide", GpuOpcode::Divide, [](double a, double b) { return a / b; });
    registerArithmetic(catalog, "math::min", GpuOpcode::Min, [](double a, double b) { return std::min(a, b); });
    registerArithmetic(catalog, "math::max", GpuOpcode::Max, [](double a, double b) { return std::max(a, b); });

    catalog.registerOperation("math::add", {{U32T, U32T}, U32T}, [](const std::vector<Value>& in) {
        return Value::make(static_cast<std::uint32_t>(in.at(0).get<std::uint32_t>() + in.at(1).get<std::uint32_t>()));
    });
    catalog.registerOperation("math::multiply", {{U32T, U32T}, U32T}, [](const std::vector<Value>& in) {
        return Value::make(static_cast<std::uint32_t>(in.at(0).get<std::uint32_t>() * in.at(1).get<std::uint32_t>()));
    });
    catalog.registerOperation("math::divide", {{U32T, U32T}, U32T}, [](const std::vector<Value>& in) {
        const auto d = in.at(1).get<std::uint32_t>();
        if (d == 0) throw std::domain_error("integer division by zero");
        return Value::make(static_cast<std::uint32_t>(in.at(0).get<std::uint32_t>() / d));
    });
    catalog.registerOperation("math::add", {{Vec2T, Vec2T}, Vec2T}, [](const std::vector<Value>& in) {
        const auto& a = in.at(0).get<DVec2>();
        const auto& b = in.at(1).get<DVec2>();
        return Value::make(DVec2{a.x + b.x, a.y + b.y});
    });

    catalog.registerOperation("math::double", {{F64T}, F64T}, [](const std::vector<Value>& in) { return Value::make(in.at(0).get<double>() * 2.0); },
                              GpuOpcode::Double);
    catalog.registerOperation("math::double", {{ArrayT}, ArrayT}, arrayUnary([](double a) { return a * 2.0; }), GpuOpcode::Double);
    catalog.registerOperation("math::double", {{U32T}, U32T},
                              [](const std::vector<Value>& in) { return Value::make(static_cast<std::uint32_t>(in.at(0).get<std::uint32_t>() * 2u)); });
    catalog.registerOperation("math::negate", {{F64T}, F64T}, [](const std::vector<Value>& in) { return Value::make(-in.at(0).get<double>()); },
                              GpuOpcode::Negate);
    catalog.registerOperation("math::negate", {{ArrayT}, ArrayT}, arrayUnary([](double a) { return -a; }), GpuOpcode::Negate);

    catalog.registerOperation("math::sum", {{ArrayT}, F64T}, [](const std::vector<Value>& in) {
        double total = 0.0;
        for (double v : in.at(0).get<F64Array>()) total += v;
        return Value::make(total);
    });

    catalog.registerOperation("vector::translate", {{PathT, Vec2T}, PathT}, [](const std::vector<Value>& in) {
        const auto& offset = in.at(1).get<DVec2>();
        PathPoints out = in.at(0).get<PathPoints>();
        for (auto& p : out) {
            p.x += offset.x;
            p.y += offset.y;
        }
        return Value::make(std::move(out));
    });
    catalog.registerOperation("vector::bounds_area", {{PathT}, F64T}, [](const std::vector<Value>& in) {
        const auto& points = in.at(0).get<PathPoints>();
        if (points.empty()) return Value::make(0.0);
        double minX = points[0].x, maxX = points[0].x, minY = points[0].y, maxY = points[0].y;
        for (const auto& p : points) {
            minX = std::min(minX, p.x);
            maxX = std::max(maxX, p.x);
            minY = std::min(minY, p.y);
            maxY = std::max(maxY, p.y);
        }
        return Value::make((maxX - minX) * (maxY - minY));
    });

    catalog.registerOperation("raster::fill", {{U32T, U32T, ColorT}, RasterT}, [](const std::vector<Value>& in) {
        Raster r;
        r.width = in.at(0).get<std::uint32_t>();
        r.height = in.at(1).get<std::uint32_t>();
        r.pixels.assign(static_cast<std::size_t>(r.width) * r.height, in.at(2).get<Color>());
        return Value::make(std::move(r));
    });
    catalog.registerOperation("raster::mean_luminance", {{RasterT}, F64T}, [](const std::vector<Value>& in) {
        const auto& r = in.at(0).get<Raster>();
        if (r.pixels.empty()) return Value::make(0.0);
        double total = 0.0;
        for (const auto& c : r.pixels) total += luminance(c);
        return Value::make(total / static_cast<double>(r.pixels.size()));
    });

    catalog.registerOperation("text::concat", {{StringT, StringT}, StringT}, [](const std::vector<Value>& in) {
        return Value::make(in.at(0).get<std::string>() + in.at(1).get<std::string>());
    });
    catalog.registerOperation("text::format", {{GenericT}, StringT}, [](const std::vector<Value>& in) { return Value::make(in.at(0).toDisplayString()); });

    catalog.registerOperation("debug::fail", {{GenericT}, GenericT}, [](const std::vector<Value>& in) -> Value {
        throw std::runtime_error(fmt::format("debug::fail invoked with {}", in.at(0).toDisplayString()));
    });
}

} // namespace NodeCraft
