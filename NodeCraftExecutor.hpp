// NodeCraft executor
//
// Demand-driven evaluation of a ProtoGraph. Each pass walks back from the
// requested nodes, reuses every cached result whose stamp still matches and
// schedules the rest on a ready queue: a unit of work becomes ready when all
// the units producing its inputs have finished. A unit is a single proto node
// or the stale nodes of one GPU segment fused into a pipeline. Units are
// dispatched to the worker pool (or run inline with a single worker) and
// their results are committed to the cache one unit at a time.
#pragma once
#include "NodeCraftBackend.hpp"
#include "NodeCraftCache.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftGpu.hpp"
#include "NodeCraftProtoGraph.hpp"
#include "NodeCraftThreadPool.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace NodeCraft {

struct EvalOutcome {
    Value value;
    std::optional<FlowError> error;
    bool ok() const { return !error.has_value(); }
};

struct ExecStats {
    unsigned long long passes = 0;
    unsigned long long operationsInvoked = 0;
    unsigned long long literalsMaterialized = 0;
    unsigned long long cacheHits = 0;
    unsigned long long sharedInFlight = 0; // units awaited from a concurrent pass
    unsigned long long gpuDispatches = 0;
    unsigned long long gpuFallbacks = 0;
    unsigned long long failures = 0;
    unsigned long long cancelledPasses = 0;
    unsigned long long readyQueueMax = 0;
    unsigned long long evalTimeNsAccum = 0;
    unsigned long long evalTimeNsMax = 0;
};

struct ExecutorOptions {
    std::size_t workerThreads = 1; // <= 1 evaluates on the calling thread
};

class Executor {
public:
    explicit Executor(ExecutorOptions options = {}, std::shared_ptr<GpuContext> gpu = nullptr);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Installs a new generation. Cache entries survive when the proto node
    // identity and stamp are unchanged; passes still running are cancelled.
    // A null plan runs everything on the CPU.
    void adopt(std::shared_ptr<const ProtoGraph> graph, std::shared_ptr<const BackendPlan> plan = nullptr);

    std::shared_ptr<const ProtoGraph> graph() const;
    std::shared_ptr<const BackendPlan> plan() const;
    std::uint64_t generation() const;

    // Throws FlowError on failure.
    Value evaluate(std::size_t index);
    EvalOutcome tryEvaluate(std::size_t index);
    // One pass for all targets; each outcome succeeds or fails on its own.
    std::vector<EvalOutcome> evaluateTargets(const std::vector<std::size_t>& targets);

    // Stops dispatching in every running pass. Passes started afterwards are
    // unaffected.
    void cancel();

    // Number of times the operation behind `index` actually ran. Survives
    // recompilation as long as the node keeps its identity.
    std::size_t executionCount(std::size_t index) const;
    std::optional<FlowError> lastError(std::size_t index) const;
    bool isCached(std::size_t index) const;
    const ResultCache& cache() const { return results; }

    ExecStats getAndResetStats();

private:
    struct NodeResult {
        Value value;
        std::optional<FlowError> error;
    };
    struct Unit;
    struct Pass;

    using InFlightKey = std::pair<std::uint64_t, ProtoNodeId>;
    struct InFlight {
        std::shared_future<Value> future;
        const Pass* owner = nullptr;
    };

    void planPass(Pass& pass, const std::vector<std::size_t>& targets);
    void schedule(Pass& pass);
    std::vector<NodeResult> runUnit(const Pass& pass, const Unit& unit);
    // `local` holds results computed so far for the leading `localNodes` of a
    // segment unit; other inputs come from the pass.
    NodeResult runNode(const Pass& pass, std::size_t index, const std::vector<std::size_t>& localNodes,
                       const std::vector<NodeResult>& local);
    std::vector<NodeResult> runSegment(const Pass& pass, const Unit& unit);
    void commit(Pass& pass, Unit& unit, std::vector<NodeResult> unitResults);
    void abandon(Pass& pass, Unit& unit);
    bool cancelled(const Pass& pass) const;
    void countExecution(ProtoNodeId id, std::size_t n = 1);
    void recordError(ProtoNodeId id, const std::optional<FlowError>& error);

    ExecutorOptions opts;
    std::shared_ptr<GpuContext> gpu;
    std::unique_ptr<ThreadPool> pool;

    mutable std::mutex stateMutex; // graph, plan, generation, in-flight table, commits
    std::shared_ptr<const ProtoGraph> currentGraph;
    std::shared_ptr<const BackendPlan> currentPlan;
    std::uint64_t currentGeneration = 0;
    std::map<InFlightKey, InFlight> inFlight;
    std::atomic<std::uint64_t> cancelEpoch{0};
    ResultCache results;

    mutable std::mutex statsMutex;
    ExecStats stats;
    std::unordered_map<ProtoNodeId, std::size_t> executions;
    std::unordered_map<ProtoNodeId, FlowError> errors;
};

} // namespace NodeCraft
