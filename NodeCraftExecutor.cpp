// NodeCraftExecutor.cpp
#include "NodeCraftExecutor.hpp"
#include "NodeCraftLog.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <stdexcept>

namespace NodeCraft {

struct Executor::Unit {
    std::vector<std::size_t> nodes;
    std::optional<std::size_t> segment;
    std::shared_ptr<const GpuPipeline> pipeline; // segment units: the stale part of the segment
    std::vector<std::size_t> dependents;
    std::size_t pending = 0;
    bool foreign = false;
    bool dispatched = false;
    bool done = false;
    std::vector<std::shared_future<Value>> awaited;            // foreign units
    std::vector<std::shared_ptr<std::promise<Value>>> promises; // owned units, one per node
};

struct Executor::Pass {
    std::shared_ptr<const ProtoGraph> graph;
    std::shared_ptr<const BackendPlan> plan;
    std::uint64_t generation = 0;
    std::uint64_t epoch = 0;

    // Written by the scheduling thread only, before dependents are dispatched.
    std::vector<std::optional<NodeResult>> values;
    std::vector<Unit> units;
    std::vector<int> unitOf;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::pair<std::size_t, std::vector<NodeResult>>> completions;
    std::vector<std::future<void>> waiters;

    void complete(std::size_t unit, std::vector<NodeResult> unitResults) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            completions.emplace_back(unit, std::move(unitResults));
        }
        cv.notify_one();
    }
};

Executor::Executor(ExecutorOptions options, std::shared_ptr<GpuContext> gpuContext) : opts(options), gpu(std::move(gpuContext)) {
    if (opts.workerThreads > 1) pool = std::make_unique<ThreadPool>(opts.workerThreads);
}

Executor::~Executor() {
    cancel();
    pool.reset();
}

void Executor::adopt(std::shared_ptr<const ProtoGraph> graph, std::shared_ptr<const BackendPlan> backendPlan) {
    if (!graph) throw std::invalid_argument("Cannot adopt an empty proto graph");
    if (!backendPlan) backendPlan = std::make_shared<const BackendPlan>(graph->size(), std::vector<GpuSegment>{});
    const std::shared_ptr<const ProtoGraph> adopted = graph;
    std::size_t evicted = 0;
    std::uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        ++cancelEpoch;
        gen = ++currentGeneration;
        currentGraph = std::move(graph);
        currentPlan = std::move(backendPlan);
        evicted = results.retain(*currentGraph);
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        for (auto it = errors.begin(); it != errors.end();) {
            if (!adopted->indexOf(it->first)) it = errors.erase(it);
            else ++it;
        }
    }
    logDebug("Adopted generation {} ({} proto nodes, {} cached, {} evicted)", gen, adopted->size(), results.size(), evicted);
}

std::shared_ptr<const ProtoGraph> Executor::graph() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentGraph;
}

std::shared_ptr<const BackendPlan> Executor::plan() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentPlan;
}

std::uint64_t Executor::generation() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentGeneration;
}

void Executor::cancel() { ++cancelEpoch; }

bool Executor::cancelled(const Pass& pass) const { return cancelEpoch.load() != pass.epoch; }

Value Executor::evaluate(std::size_t index) {
    EvalOutcome outcome = tryEvaluate(index);
    if (outcome.error) throw *outcome.error;
    return outcome.value;
}

EvalOutcome Executor::tryEvaluate(std::size_t index) { return evaluateTargets({index}).front(); }

std::vector<EvalOutcome> Executor::evaluateTargets(const std::vector<std::size_t>& targets) {
    auto t0 = std::chrono::steady_clock::now();
    Pass pass;
    std::vector<std::size_t> valid;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (!currentGraph) throw std::runtime_error("No proto graph adopted");
        pass.graph = currentGraph;
        pass.plan = currentPlan;
        pass.generation = currentGeneration;
        pass.epoch = cancelEpoch.load();
        for (std::size_t t : targets)
            if (t < pass.graph->size()) valid.push_back(t);
        planPass(pass, valid);
    }
    schedule(pass);

    std::vector<EvalOutcome> out;
    out.reserve(targets.size());
    for (std::size_t t : targets) {
        EvalOutcome o;
        if (t >= pass.graph->size()) {
            o.error = FlowError(ErrorKind::DanglingReference, fmt::format("No proto node at index {}", t));
        } else if (!pass.values[t]) {
            o.error = cancelled(pass) ? FlowError(ErrorKind::Cancelled, "Evaluation was cancelled", pass.graph->node(t).path)
                                      : FlowError(ErrorKind::MissingInput, "Pass finished without a result", pass.graph->node(t).path);
            if (o.error->isInternal()) logError("{}", o.error->what());
        } else {
            o.value = pass.values[t]->value;
            o.error = pass.values[t]->error;
        }
        out.push_back(std::move(o));
    }

    auto ns = static_cast<unsigned long long>(std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count());
    {
        std::lock_guard<std::mutex> lock(statsMutex);
        ++stats.passes;
        if (cancelled(pass)) ++stats.cancelledPasses;
        stats.evalTimeNsAccum += ns;
        stats.evalTimeNsMax = std::max(stats.evalTimeNsMax, ns);
    }
    return out;
}

void Executor::planPass(Pass& pass, const std::vector<std::size_t>& targets) {
    const ProtoGraph& graph = *pass.graph;
    const BackendPlan& backend = *pass.plan;
    const std::size_t n = graph.size();
    pass.values.assign(n, std::nullopt);
    pass.unitOf.assign(n, -1);
    if (targets.empty()) return;

    std::vector<char> needed(n, 0), run(n, 0), foreign(n, 0);
    for (std::size_t t : targets) needed[t] = 1;
    unsigned long long hits = 0;

    auto inFlightHere = [&](std::size_t i) { return inFlight.count({pass.generation, graph.node(i).id}) != 0; };
    auto needInputs = [&](std::size_t i) {
        for (const auto& in : graph.node(i).inputs)
            if (in.isNode()) needed[in.node()] = 1;
    };

    const std::size_t last = *std::max_element(targets.begin(), targets.end());
    for (std::size_t i = last + 1; i-- > 0;) {
        if (!needed[i]) continue;
        const ProtoNode& node = graph.node(i);
        if (node.error) {
            pass.values[i] = NodeResult{Value(), *node.error};
            continue;
        }
        if (auto cached = results.lookup(node.id, node.stamp)) {
            pass.values[i] = NodeResult{std::move(*cached), std::nullopt};
            ++hits;
            continue;
        }
        run[i] = 1;
        foreign[i] = inFlightHere(i);
        if (!foreign[i]) needInputs(i);
    }

    // Units in ascending node order. The stale nodes of a GPU segment that
    // this pass owns share one unit; cached and foreign segment nodes are read
    // as pipeline inputs.
    for (std::size_t i = 0; i < n; ++i) {
        if (!run[i] || pass.unitOf[i] >= 0) continue;
        Unit unit;
        unit.foreign = foreign[i];
        auto seg = backend.segmentOf(i);
        if (seg && !unit.foreign) {
            const GpuSegment& segment = backend.segments()[*seg];
            unit.segment = seg;
            for (std::size_t m : segment.nodes)
                if (run[m] && !foreign[m]) unit.nodes.push_back(m);
            if (unit.nodes == segment.nodes) {
                unit.pipeline = segment.pipeline;
            } else {
                unit.pipeline = GpuCompiler::compile(graph, unit.nodes, fmt::format("{}_from{}", segment.pipeline->name(), unit.nodes.front()));
            }
        } else {
            unit.nodes = {i};
        }
        for (std::size_t m : unit.nodes) pass.unitOf[m] = static_cast<int>(pass.units.size());
        pass.units.push_back(std::move(unit));
    }

    // In-flight entries of a unit are registered and released under one lock,
    // so a foreign unit always finds all of its nodes.
    for (auto& unit : pass.units) {
        if (!unit.foreign) continue;
        for (std::size_t m : unit.nodes) unit.awaited.push_back(inFlight.at({pass.generation, graph.node(m).id}).future);
    }

    for (std::size_t u = 0; u < pass.units.size(); ++u) {
        Unit& unit = pass.units[u];
        if (unit.foreign) continue;
        std::vector<std::size_t> deps;
        for (std::size_t m : unit.nodes) {
            for (const auto& in : graph.node(m).inputs) {
                if (!in.isNode()) continue;
                const int d = pass.unitOf[in.node()];
                if (d < 0 || static_cast<std::size_t>(d) == u) continue;
                if (std::find(deps.begin(), deps.end(), static_cast<std::size_t>(d)) == deps.end()) deps.push_back(static_cast<std::size_t>(d));
            }
        }
        unit.pending = deps.size();
        for (std::size_t d : deps) pass.units[d].dependents.push_back(u);
        for (std::size_t m : unit.nodes) {
            auto promise = std::make_shared<std::promise<Value>>();
            inFlight[{pass.generation, graph.node(m).id}] = InFlight{promise->get_future().share(), &pass};
            unit.promises.push_back(std::move(promise));
        }
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex);
        stats.cacheHits += hits;
    }
    logDebug("Pass over generation {}: {} targets, {} cache hits, {} units to run", pass.generation, targets.size(), hits, pass.units.size());
}

void Executor::schedule(Pass& pass) {
    std::deque<std::size_t> ready;
    for (std::size_t u = 0; u < pass.units.size(); ++u)
        if (pass.units[u].foreign || pass.units[u].pending == 0) ready.push_back(u);

    std::size_t running = 0;
    std::size_t finished = 0;
    unsigned long long readyMax = ready.size();
    unsigned long long shared = 0;

    while (finished < pass.units.size()) {
        const bool stop = cancelled(pass);
        while (!stop && !ready.empty()) {
            const std::size_t u = ready.front();
            ready.pop_front();
            Unit& unit = pass.units[u];
            unit.dispatched = true;
            ++running;
            if (unit.foreign) {
                ++shared;
                pass.waiters.push_back(std::async(std::launch::async, [&pass, u] {
                    const Unit& awaitedUnit = pass.units[u];
                    std::vector<NodeResult> out;
                    for (const auto& f : awaitedUnit.awaited) {
                        try {
                            out.push_back(NodeResult{f.get(), std::nullopt});
                        } catch (const FlowError& e) {
                            out.push_back(NodeResult{Value(), e});
                        }
                    }
                    pass.complete(u, std::move(out));
                }));
            } else if (pool) {
                pool->post([this, &pass, u] { pass.complete(u, runUnit(pass, pass.units[u])); });
            } else {
                pass.complete(u, runUnit(pass, pass.units[u]));
            }
        }
        if (running == 0) break;

        std::pair<std::size_t, std::vector<NodeResult>> done;
        {
            std::unique_lock<std::mutex> lock(pass.mutex);
            pass.cv.wait(lock, [&pass] { return !pass.completions.empty(); });
            done = std::move(pass.completions.front());
            pass.completions.pop_front();
        }
        --running;
        ++finished;
        Unit& unit = pass.units[done.first];
        unit.done = true;
        commit(pass, unit, std::move(done.second));
        for (std::size_t d : unit.dependents)
            if (--pass.units[d].pending == 0) ready.push_back(d);
        readyMax = std::max<unsigned long long>(readyMax, ready.size());
    }

    // Cancelled: release everything that never ran.
    for (auto& unit : pass.units)
        if (!unit.done && !unit.dispatched) abandon(pass, unit);
    for (auto& w : pass.waiters) w.wait();

    std::lock_guard<std::mutex> lock(statsMutex);
    stats.readyQueueMax = std::max(stats.readyQueueMax, readyMax);
    stats.sharedInFlight += shared;
}

std::vector<Executor::NodeResult> Executor::runUnit(const Pass& pass, const Unit& unit) {
    if (cancelled(pass)) {
        std::vector<NodeResult> out;
        for (std::size_t m : unit.nodes)
            out.push_back(NodeResult{Value(), FlowError(ErrorKind::Cancelled, "Evaluation was cancelled", pass.graph->node(m).path)});
        return out;
    }
    if (unit.segment) return runSegment(pass, unit);
    return {runNode(pass, unit.nodes.front(), {}, {})};
}

Executor::NodeResult Executor::runNode(const Pass& pass, std::size_t index, const std::vector<std::size_t>& localNodes,
                                       const std::vector<NodeResult>& local) {
    const ProtoNode& node = pass.graph->node(index);
    if (node.error) return NodeResult{Value(), *node.error};

    std::vector<Value> args;
    args.reserve(node.inputs.size());
    for (const auto& in : node.inputs) {
        if (!in.isNode()) {
            args.push_back(Value::fromTagged(in.literal()));
            continue;
        }
        const std::size_t up = in.node();
        const NodeResult* r = nullptr;
        const auto localEnd = localNodes.begin() + static_cast<std::ptrdiff_t>(local.size());
        const auto it = std::lower_bound(localNodes.begin(), localEnd, up);
        if (it != localEnd && *it == up) r = &local[static_cast<std::size_t>(it - localNodes.begin())];
        else if (pass.values[up]) r = &*pass.values[up];
        if (!r) {
            FlowError e(ErrorKind::MissingInput, fmt::format("Input {} has no value", formatPath(pass.graph->node(up).path)), node.path);
            logError("{}", e.what());
            return NodeResult{Value(), e};
        }
        if (r->error) return NodeResult{Value(), r->error};
        args.push_back(r->value);
    }

    if (node.literal) {
        std::lock_guard<std::mutex> lock(statsMutex);
        ++stats.literalsMaterialized;
        return NodeResult{args.empty() ? Value() : args.front(), std::nullopt};
    }
    if (!node.resolved->cpu) {
        return NodeResult{Value(), FlowError(ErrorKind::BackendUnavailable,
                                             fmt::format("{} has no CPU implementation and no GPU is available", node.label()), node.path)};
    }

    countExecution(node.id);
    NodeResult result;
    try {
        result.value = node.resolved->cpu(args);
        if (node.outputType.isConcrete() && result.value.concreteType() != node.outputType)
            throw FlowError(ErrorKind::TypeMismatch,
                            fmt::format("{} returned {} instead of {}", node.label(), result.value.typeName(), node.outputType.toString()));
    } catch (const FlowError& e) {
        result = NodeResult{Value(), e.node().empty() ? e.withNode(node.path) : e};
    } catch (const std::exception& e) {
        result = NodeResult{Value(), FlowError(ErrorKind::OperationPanic, e.what(), node.path)};
    }
    recordError(node.id, result.error);
    if (result.error) logDebug("{} failed: {}", node.label(), result.error->what());
    return result;
}

std::vector<Executor::NodeResult> Executor::runSegment(const Pass& pass, const Unit& unit) {
    const GpuPipeline& pipeline = *unit.pipeline;

    auto interpret = [&] {
        std::vector<NodeResult> local;
        local.reserve(unit.nodes.size());
        for (std::size_t m : unit.nodes) local.push_back(runNode(pass, m, unit.nodes, local));
        return local;
    };
    auto fallback = [&](const std::string& reason) {
        logWarn("GPU {} unavailable for {} ({}), interpreting on the CPU", gpu ? gpu->name() : "context", pipeline.name(), reason);
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            ++stats.gpuFallbacks;
        }
        return interpret();
    };

    std::vector<Value> inputs;
    for (const auto& in : pipeline.inputs()) {
        if (!in.isNode()) {
            inputs.push_back(Value::fromTagged(in.literal()));
        } else if (pass.values[in.node()] && !pass.values[in.node()]->error) {
            inputs.push_back(pass.values[in.node()]->value);
        } else {
            // Upstream failure or missing value: the node-by-node path reports it per node.
            return interpret();
        }
    }
    if (!gpu) return fallback("no device");
    if (!gpu->available()) return fallback("device offline");

    std::vector<GpuBuffer> buffers;
    try {
        for (const Value& v : inputs) buffers.push_back(toGpuBuffer(v));
    } catch (const FlowError& e) {
        std::vector<NodeResult> out;
        for (std::size_t m : unit.nodes) out.push_back(NodeResult{Value(), e.withNode(pass.graph->node(m).path)});
        return out;
    }

    std::vector<GpuBuffer> outputs;
    try {
        outputs = gpu->submit(unit.pipeline, std::move(buffers)).get();
    } catch (const FlowError& e) {
        if (e.kind() == ErrorKind::BackendUnavailable) return fallback(e.detail());
        // Device-side failure: rerun on the CPU to attribute it to the right node.
        logDebug("Pipeline {} failed on the device: {}", pipeline.name(), e.what());
        return interpret();
    } catch (const std::exception& e) {
        logWarn("Pipeline {} raised a device error: {}", pipeline.name(), e.what());
        return interpret();
    }

    std::vector<NodeResult> out;
    out.reserve(unit.nodes.size());
    for (std::size_t r = 0; r < unit.nodes.size(); ++r) {
        const ProtoNode& node = pass.graph->node(unit.nodes[r]);
        try {
            out.push_back(NodeResult{fromGpuBuffer(outputs.at(r), node.outputType), std::nullopt});
        } catch (const FlowError& e) {
            out.push_back(NodeResult{Value(), e.withNode(node.path)});
        }
        countExecution(node.id);
        recordError(node.id, out.back().error);
    }
    std::lock_guard<std::mutex> lock(statsMutex);
    ++stats.gpuDispatches;
    return out;
}

void Executor::commit(Pass& pass, Unit& unit, std::vector<NodeResult> unitResults) {
    if (unitResults.size() != unit.nodes.size()) {
        logError("Unit produced {} results for {} nodes", unitResults.size(), unit.nodes.size());
        unitResults.resize(unit.nodes.size(), NodeResult{Value(), FlowError(ErrorKind::MissingInput, "Unit result missing")});
    }
    unsigned long long failed = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        // A stale generation or a cancelled pass commits nothing to the cache.
        const bool current = !unit.foreign && pass.generation == currentGeneration && !cancelled(pass);
        for (std::size_t k = 0; k < unit.nodes.size(); ++k) {
            const std::size_t m = unit.nodes[k];
            const ProtoNode& node = pass.graph->node(m);
            NodeResult& r = unitResults[k];
            if (r.error) ++failed;
            else if (current) results.store(node.id, node.stamp, r.value);
            if (!unit.foreign) {
                if (r.error) unit.promises[k]->set_exception(std::make_exception_ptr(*r.error));
                else unit.promises[k]->set_value(r.value);
                auto it = inFlight.find({pass.generation, node.id});
                if (it != inFlight.end() && it->second.owner == &pass) inFlight.erase(it);
            }
            pass.values[m] = std::move(r);
        }
    }
    if (failed) {
        std::lock_guard<std::mutex> lock(statsMutex);
        stats.failures += failed;
    }
}

void Executor::abandon(Pass& pass, Unit& unit) {
    std::lock_guard<std::mutex> lock(stateMutex);
    for (std::size_t k = 0; k < unit.nodes.size(); ++k) {
        const ProtoNode& node = pass.graph->node(unit.nodes[k]);
        FlowError e(ErrorKind::Cancelled, "Evaluation was cancelled", node.path);
        if (!unit.foreign) {
            unit.promises[k]->set_exception(std::make_exception_ptr(e));
            auto it = inFlight.find({pass.generation, node.id});
            if (it != inFlight.end() && it->second.owner == &pass) inFlight.erase(it);
        }
        pass.values[unit.nodes[k]] = NodeResult{Value(), e};
    }
    unit.done = true;
}

void Executor::countExecution(ProtoNodeId id, std::size_t n) {
    std::lock_guard<std::mutex> lock(statsMutex);
    executions[id] += n;
    stats.operationsInvoked += n;
}

void Executor::recordError(ProtoNodeId id, const std::optional<FlowError>& error) {
    std::lock_guard<std::mutex> lock(statsMutex);
    if (error) errors.insert_or_assign(id, *error);
    else errors.erase(id);
}

std::size_t Executor::executionCount(std::size_t index) const {
    auto g = graph();
    if (!g || index >= g->size()) return 0;
    std::lock_guard<std::mutex> lock(statsMutex);
    auto it = executions.find(g->node(index).id);
    return it == executions.end() ? 0 : it->second;
}

std::optional<FlowError> Executor::lastError(std::size_t index) const {
    auto g = graph();
    if (!g || index >= g->size()) return std::nullopt;
    std::lock_guard<std::mutex> lock(statsMutex);
    auto it = errors.find(g->node(index).id);
    if (it == errors.end()) return std::nullopt;
    return it->second;
}

bool Executor::isCached(std::size_t index) const {
    auto g = graph();
    if (!g || index >= g->size()) return false;
    return results.contains(g->node(index).id, g->node(index).stamp);
}

ExecStats Executor::getAndResetStats() {
    std::lock_guard<std::mutex> lock(statsMutex);
    ExecStats out = stats;
    stats = ExecStats{};
    return out;
}

} // namespace NodeCraft
