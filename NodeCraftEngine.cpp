// NodeCraftEngine.cpp
#include "NodeCraftEngine.hpp"
#include "NodeCraftLog.hpp"
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace NodeCraft {

namespace {

std::shared_ptr<GpuContext> defaultContext(const EngineConfig& cfg, std::shared_ptr<GpuContext> given) {
    if (!cfg.gpuEnabled) return nullptr;
    if (given) return given;
    return std::make_shared<HostComputeContext>();
}

} // namespace

FlowEngine::FlowEngine(const OperationCatalog& catalog, EngineConfig config, std::shared_ptr<GpuContext> gpuContext)
    : catalog(catalog),
      cfg(config),
      gpu(defaultContext(config, std::move(gpuContext))),
      compiler(catalog, CompilerOptions{config.maxInlineDepth, config.overloadPolicy}),
      executorImpl(ExecutorOptions{config.workerThreads}, gpu) {}

void FlowEngine::recompile(const Graph& graph) {
    auto t0 = std::chrono::steady_clock::now();
    validate(graph, &catalog);
    auto proto = compiler.compile(graph);
    const bool gpuAvailable = gpu && gpu->available();
    auto backendPlan = BackendSelector::partition(*proto, gpuAvailable);
    executorImpl.adopt(proto, backendPlan);
    ++recompiles;
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();
    logInfo("Recompiled: {} proto nodes, {} GPU segments, {} resolution errors ({} us)", proto->size(), backendPlan->segments().size(),
            proto->errorCount(), us);
}

std::size_t FlowEngine::indexOf(NodeId rootNode) const {
    auto proto = protoGraph();
    if (!proto) throw std::runtime_error("Engine has no compiled graph");
    auto index = proto->indexOfRoot(rootNode);
    if (!index) throw FlowError(ErrorKind::DanglingReference, fmt::format("Unknown node {}", rootNode), NodePath{rootNode});
    return *index;
}

Value FlowEngine::evaluate(NodeId rootNode) { return executorImpl.evaluate(indexOf(rootNode)); }

EvalOutcome FlowEngine::tryEvaluate(NodeId rootNode) {
    auto proto = protoGraph();
    if (!proto) throw std::runtime_error("Engine has no compiled graph");
    auto index = proto->indexOfRoot(rootNode);
    if (!index) return EvalOutcome{Value(), FlowError(ErrorKind::DanglingReference, fmt::format("Unknown node {}", rootNode), NodePath{rootNode})};
    return executorImpl.tryEvaluate(*index);
}

Value FlowEngine::evaluatePath(const NodePath& path) {
    auto proto = protoGraph();
    if (!proto) throw std::runtime_error("Engine has no compiled graph");
    auto index = proto->indexOfPath(path);
    // A network node's own path maps to the node producing its output.
    if (!index && path.size() == 1) index = proto->indexOfRoot(path.front());
    if (!index) throw FlowError(ErrorKind::DanglingReference, fmt::format("No compiled node at {}", formatPath(path)), path);
    return executorImpl.evaluate(*index);
}

std::vector<EvalOutcome> FlowEngine::evaluateTargets(const std::vector<NodeId>& rootNodes) {
    auto proto = protoGraph();
    if (!proto) throw std::runtime_error("Engine has no compiled graph");
    std::vector<std::size_t> indices;
    std::vector<std::optional<std::size_t>> slot;
    for (NodeId id : rootNodes) {
        auto index = proto->indexOfRoot(id);
        slot.push_back(index ? std::optional<std::size_t>(indices.size()) : std::nullopt);
        if (index) indices.push_back(*index);
    }
    std::vector<EvalOutcome> evaluated = executorImpl.evaluateTargets(indices);
    std::vector<EvalOutcome> out;
    for (std::size_t i = 0; i < rootNodes.size(); ++i) {
        if (slot[i]) out.push_back(evaluated[*slot[i]]);
        else out.push_back(EvalOutcome{Value(), FlowError(ErrorKind::DanglingReference, fmt::format("Unknown node {}", rootNodes[i]), NodePath{rootNodes[i]})});
    }
    return out;
}

Value FlowEngine::evaluateExport() {
    auto proto = protoGraph();
    if (!proto) throw std::runtime_error("Engine has no compiled graph");
    if (!proto->exported()) throw FlowError(ErrorKind::DanglingReference, "Graph has no export");
    return executorImpl.evaluate(*proto->exported());
}

std::size_t FlowEngine::executionCount(NodeId rootNode) const { return executorImpl.executionCount(indexOf(rootNode)); }

std::size_t FlowEngine::writeKernelSources(const std::string& directory) const {
    auto backendPlan = plan();
    if (!backendPlan) return 0;
    std::filesystem::create_directories(directory);
    for (const auto& segment : backendPlan->segments()) {
        const auto path = std::filesystem::path(directory) / (segment.pipeline->name() + ".comp");
        std::ofstream out(path);
        if (!out.is_open()) throw std::runtime_error(fmt::format("Cannot write {}", path.string()));
        out << segment.pipeline->kernelSource();
        logDebug("Wrote kernel source {}", path.string());
    }
    return backendPlan->segments().size();
}

} // namespace NodeCraft
