// NodeCraftBackend.cpp
#include "NodeCraftBackend.hpp"
#include "NodeCraftLog.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace NodeCraft {

const char* backendName(Backend backend) { return backend == Backend::Gpu ? "gpu" : "cpu"; }

BackendPlan::BackendPlan(std::size_t nodeCount, std::vector<GpuSegment> segments)
    : gpuSegments(std::move(segments)), segmentIndex(nodeCount, -1) {
    for (std::size_t s = 0; s < gpuSegments.size(); ++s)
        for (std::size_t n : gpuSegments[s].nodes) segmentIndex.at(n) = static_cast<int>(s);
}

Backend BackendPlan::backendOf(std::size_t index) const { return segmentOf(index) ? Backend::Gpu : Backend::Cpu; }

std::optional<std::size_t> BackendPlan::segmentOf(std::size_t index) const {
    if (index >= segmentIndex.size() || segmentIndex[index] < 0) return std::nullopt;
    return static_cast<std::size_t>(segmentIndex[index]);
}

std::size_t BackendPlan::gpuNodeCount() const {
    std::size_t n = 0;
    for (const auto& s : gpuSegments) n += s.nodes.size();
    return n;
}

nlohmann::json BackendPlan::toJson() const {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& s : gpuSegments) segments.push_back(nlohmann::json{{"pipeline", s.pipeline->name()}, {"nodes", s.nodes}});
    return nlohmann::json{{"segments", std::move(segments)}, {"gpuNodes", gpuNodeCount()}, {"cpuNodes", segmentIndex.size() - gpuNodeCount()}};
}

bool BackendSelector::eligible(const ProtoNode& node) {
    if (!node.gpuEligible()) return false;
    if (!hasGpuRepresentation(node.outputType)) return false;
    return std::all_of(node.inputTypes.begin(), node.inputTypes.end(), [](const Type& t) { return hasGpuRepresentation(t); });
}

std::shared_ptr<const BackendPlan> BackendSelector::partition(const ProtoGraph& graph, bool gpuAvailable) {
    std::vector<GpuSegment> segments;
    if (gpuAvailable) {
        std::vector<std::size_t> run;
        auto flush = [&] {
            if (run.empty()) return;
            GpuSegment segment;
            segment.nodes = run;
            segment.pipeline = GpuCompiler::compile(graph, run, fmt::format("segment{}_{}", segments.size(), run.front()));
            segments.push_back(std::move(segment));
            run.clear();
        };
        for (std::size_t i = 0; i < graph.size(); ++i) {
            if (eligible(graph.node(i))) run.push_back(i);
            else flush();
        }
        flush();
    }
    auto plan = std::make_shared<const BackendPlan>(graph.size(), std::move(segments));
    logDebug("Backend plan: {} GPU segments covering {} of {} nodes", plan->segments().size(), plan->gpuNodeCount(), graph.size());
    return plan;
}

} // namespace NodeCraft
