// NodeCraft operation catalog
//
// The catalog is the seam to the library of concrete node implementations:
// each operation identifier maps to one or more typed overloads, each with a
// CPU kernel and, when the operation is a simple element-wise computation, a
// GPU opcode the backend compiler can fuse into a compute pipeline.
#pragma once
#include "NodeCraftTypes.hpp"
#include "NodeCraftValue.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace NodeCraft {

using CpuKernel = std::function<Value(const std::vector<Value>& inputs)>;

// Element-wise instructions understood by the GPU compiler.
enum class GpuOpcode { Identity, Add, Subtract, Multiply, Divide, Negate, Double, Min, Max };

const char* gpuOpcodeName(GpuOpcode op);
std::size_t gpuOpcodeArity(GpuOpcode op);

struct OperationSignature {
    std::vector<Type> inputs;
    Type output;
    std::string toString() const;
    std::size_t specificity() const; // number of concrete input types
};

struct Operation {
    std::string identifier;
    OperationSignature signature;
    CpuKernel cpu;                 // empty for GPU-only operations
    std::optional<GpuOpcode> gpu;  // set when the operation is GPU-eligible
    std::size_t declarationOrder = 0;
    bool literal = false;          // materializes its literal input, never "runs"

    std::string instanceName(const std::vector<Type>& inputTypes) const;
};

enum class OverloadPolicy {
    MostSpecific,     // most concrete parameters wins, ties go to the first declared
    DeclarationOrder, // first declared matching overload wins
    Strict,           // most concrete parameters wins, ties are AmbiguousOverload
};

const char* overloadPolicyName(OverloadPolicy policy);
std::optional<OverloadPolicy> parseOverloadPolicy(const std::string& name);

struct Resolution {
    const Operation* operation = nullptr;
    std::vector<Type> inputTypes;
    Type outputType;
};

class OperationCatalog {
public:
    const Operation& registerOperation(const std::string& identifier, OperationSignature signature, CpuKernel cpu,
                                       std::optional<GpuOpcode> gpu = std::nullopt);
    // Registers core::value; the compiler synthesizes it for literal sources.
    const Operation& registerLiteralOperation(const std::string& identifier);

    bool contains(const std::string& identifier) const { return operations.count(identifier) != 0; }
    std::vector<const Operation*> overloads(const std::string& identifier) const;
    std::size_t size() const;

    // Picks the overload for concrete argument types. Throws FlowError with
    // TypeResolutionError or AmbiguousOverload; the caller attaches the node.
    Resolution resolve(const std::string& identifier, const std::vector<Type>& argTypes, OverloadPolicy policy) const;

private:
    std::map<std::string, std::vector<std::unique_ptr<Operation>>> operations;
    std::size_t declared = 0;
};

// Identifier of the synthesized literal operation.
inline constexpr const char* kValueOperation = "core::value";

// Registers the operations the engine ships with (core, math, vector,
// raster, text and debug families).
void registerBuiltinOperations(OperationCatalog& catalog);

} // namespace NodeCraft
