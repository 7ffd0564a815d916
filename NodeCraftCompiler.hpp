// NodeCraft graph compiler
//
// Lowers the editable Graph into a ProtoGraph: network nodes are inlined,
// every operation call is resolved against the catalog, the result is put in
// a deterministic topological order and every node receives an identity path
// and a content stamp.
#pragma once
#include "NodeCraftCatalog.hpp"
#include "NodeCraftGraph.hpp"
#include "NodeCraftProtoGraph.hpp"
#include <memory>

namespace NodeCraft {

struct CompilerOptions {
    std::size_t maxInlineDepth = 64;
    OverloadPolicy overloadPolicy = OverloadPolicy::MostSpecific;
};

class Compiler {
public:
    explicit Compiler(const OperationCatalog& catalog, CompilerOptions options = {});

    // Throws FlowError for structural failures (cycles, dangling references,
    // unbounded recursion). Resolution failures are recorded on the affected
    // proto nodes instead.
    std::shared_ptr<const ProtoGraph> compile(const Graph& graph) const;

    const CompilerOptions& options() const { return opts; }

private:
    const OperationCatalog& catalog;
    CompilerOptions opts;
};

} // namespace NodeCraft
