// NodeCraft engine
//
// Entry point for the editor shell. recompile() turns the current document
// graph into a new proto graph generation (validate, compile, choose
// backends, hand over to the executor); evaluation requests name document
// nodes and are answered from the cache wherever nothing changed.
#pragma once
#include "NodeCraftBackend.hpp"
#include "NodeCraftCatalog.hpp"
#include "NodeCraftCompiler.hpp"
#include "NodeCraftConfig.hpp"
#include "NodeCraftExecutor.hpp"
#include "NodeCraftGraph.hpp"
#include <memory>
#include <string>
#include <vector>

namespace NodeCraft {

class FlowEngine {
public:
    // With gpuEnabled and no context given, a HostComputeContext is created.
    explicit FlowEngine(const OperationCatalog& catalog, EngineConfig config = {}, std::shared_ptr<GpuContext> gpu = nullptr);

    // Structural errors propagate and leave the previous generation active.
    void recompile(const Graph& graph);

    Value evaluate(NodeId rootNode);
    EvalOutcome tryEvaluate(NodeId rootNode);
    // Any inlined node, addressed by its identity path.
    Value evaluatePath(const NodePath& path);
    std::vector<EvalOutcome> evaluateTargets(const std::vector<NodeId>& rootNodes);
    Value evaluateExport();

    std::shared_ptr<const ProtoGraph> protoGraph() const { return executorImpl.graph(); }
    std::shared_ptr<const BackendPlan> plan() const { return executorImpl.plan(); }
    std::size_t indexOf(NodeId rootNode) const;
    std::size_t executionCount(NodeId rootNode) const;

    void cancel() { executorImpl.cancel(); }
    ExecStats getAndResetStats() { return executorImpl.getAndResetStats(); }
    std::size_t recompileCount() const { return recompiles; }

    // Writes one <pipeline>.comp file per GPU segment; returns the count.
    std::size_t writeKernelSources(const std::string& directory) const;

    const EngineConfig& config() const { return cfg; }
    const std::shared_ptr<GpuContext>& gpuContext() const { return gpu; }
    Executor& executor() { return executorImpl; }

private:
    const OperationCatalog& catalog;
    EngineConfig cfg;
    std::shared_ptr<GpuContext> gpu;
    Compiler compiler;
    Executor executorImpl;
    std::size_t recompiles = 0;
};

} // namespace NodeCraft
