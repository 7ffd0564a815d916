// NodeCraft backend selection
//
// Decides once per proto graph generation where each node runs. Maximal
// contiguous runs of GPU-eligible nodes become GPU segments, each compiled
// into a single fused pipeline; every other node runs on the CPU.
#pragma once
#include "NodeCraftGpu.hpp"
#include "NodeCraftProtoGraph.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace NodeCraft {

enum class Backend { Cpu, Gpu };

const char* backendName(Backend backend);

struct GpuSegment {
    std::vector<std::size_t> nodes; // ascending, contiguous
    std::shared_ptr<const GpuPipeline> pipeline;
};

class BackendPlan {
public:
    BackendPlan() = default;
    BackendPlan(std::size_t nodeCount, std::vector<GpuSegment> segments);

    Backend backendOf(std::size_t index) const;
    std::optional<std::size_t> segmentOf(std::size_t index) const;
    const std::vector<GpuSegment>& segments() const { return gpuSegments; }
    std::size_t gpuNodeCount() const;

    nlohmann::json toJson() const;

private:
    std::vector<GpuSegment> gpuSegments;
    std::vector<int> segmentIndex; // per proto node, -1 for CPU
};

class BackendSelector {
public:
    static bool eligible(const ProtoNode& node);
    static std::shared_ptr<const BackendPlan> partition(const ProtoGraph& graph, bool gpuAvailable);
};

} // namespace NodeCraft
