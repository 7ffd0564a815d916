// NodeCraftCompiler.cpp
#include "NodeCraftCompiler.hpp"
#include "NodeCraftHash.hpp"
#include "NodeCraftLog.hpp"
#include <chrono>
#include <set>
#include <variant>

namespace NodeCraft {

namespace {

// Source of a flattened input: index into the flat list, or a literal.
using FlatSource = std::variant<std::size_t, TaggedValue>;

struct FlatNode {
    NodePath path;
    std::string name;
    std::string operation;
    std::vector<FlatSource> inputs;
    std::vector<Type> declaredInputs;
    Type declaredOutput;
};

struct Scope {
    const Network* network = nullptr;
    NodePath prefix;
    std::vector<FlatSource> imports;
    std::size_t depth = 0;
    std::map<NodeId, FlatSource> memo;
    std::set<NodeId> active;
};

NodePath childPath(const NodePath& prefix, NodeId id) {
    NodePath p = prefix;
    p.push_back(id);
    return p;
}

class Inliner {
public:
    Inliner(const Graph& g, std::size_t maxDepth) : graph(g), maxDepth(maxDepth) {}

    // Walks the wires of one scope with an explicit work stack; only network
    // nesting recurses, and maxDepth bounds that.
    FlatSource resolve(Scope& scope, NodeId start) {
        std::vector<std::pair<NodeId, bool>> work{{start, false}}; // node, inputs pushed
        while (!work.empty()) {
            const NodeId id = work.back().first;
            if (scope.memo.count(id)) {
                work.pop_back();
                continue;
            }
            const NodePath path = childPath(scope.prefix, id);
            const Node* node = scope.network->node(id);
            if (!node) throw FlowError(ErrorKind::DanglingReference, fmt::format("Unknown node {}", id), scope.prefix);

            if (!work.back().second) {
                // Active nodes are exactly the expanded entries still on the stack.
                if (scope.active.count(id)) throw FlowError(ErrorKind::CycleDetected, "Node depends on itself", path);
                if (const auto* net = std::get_if<NetworkImpl>(&node->implementation)) {
                    if (scope.depth + 1 > maxDepth)
                        throw FlowError(ErrorKind::UnboundedRecursion,
                                        fmt::format("Inlining '{}' exceeds the depth limit of {}", net->definition, maxDepth), path);
                    if (!graph.definition(net->definition))
                        throw FlowError(ErrorKind::DanglingReference, fmt::format("Unknown network definition '{}'", net->definition), path);
                }
                scope.active.insert(id);
                work.back().second = true;
                // Reversed so the first input is flattened first.
                for (auto in = node->inputs.rbegin(); in != node->inputs.rend(); ++in) {
                    const Wire* w = in->wire();
                    if (!w) continue;
                    if (!scope.network->contains(w->node))
                        throw FlowError(ErrorKind::DanglingReference, fmt::format("Input '{}' reads unknown node {}", in->name, w->node), path);
                    if (scope.active.count(w->node))
                        throw FlowError(ErrorKind::CycleDetected, "Node depends on itself", childPath(scope.prefix, w->node));
                    if (!scope.memo.count(w->node)) work.emplace_back(w->node, false);
                }
                continue;
            }

            work.pop_back();
            FlatSource result = build(scope, *node, path);
            scope.active.erase(id);
            scope.memo.emplace(id, std::move(result));
        }
        return scope.memo.at(start);
    }

    std::vector<FlatNode> flatNodes;

private:
    // All wired inputs of `node` are resolved when this runs.
    FlatSource build(Scope& scope, const Node& node, const NodePath& path) {
        if (const auto* param = std::get_if<ParameterImpl>(&node.implementation)) {
            if (param->importIndex >= scope.imports.size())
                throw FlowError(ErrorKind::DanglingReference, fmt::format("Parameter reads missing import {}", param->importIndex), path);
            return scope.imports[param->importIndex];
        }
        if (const auto* prim = std::get_if<PrimitiveImpl>(&node.implementation)) {
            FlatNode flat;
            flat.path = path;
            flat.name = node.name;
            flat.operation = prim->operation;
            flat.declaredOutput = node.outputType;
            for (const auto& in : node.inputs) {
                flat.inputs.push_back(inputSource(scope, in));
                flat.declaredInputs.push_back(in.declaredType);
            }
            flatNodes.push_back(std::move(flat));
            return flatNodes.size() - 1;
        }
        const auto& net = std::get<NetworkImpl>(node.implementation);
        const Network* def = graph.definition(net.definition);
        Scope inner;
        inner.network = def;
        inner.prefix = path;
        inner.depth = scope.depth + 1;
        for (const auto& in : node.inputs) inner.imports.push_back(inputSource(scope, in));
        const auto exported = def->exported();
        if (!exported) throw FlowError(ErrorKind::DanglingReference, fmt::format("Network '{}' has no export", net.definition), path);
        return resolve(inner, *exported);
    }

    FlatSource inputSource(const Scope& scope, const NodeInput& in) const {
        if (const Wire* w = in.wire()) return scope.memo.at(w->node);
        return in.literal()->value;
    }

    const Graph& graph;
    std::size_t maxDepth;
};

// Kahn ordering over the flat list. Ready nodes are taken lowest original
// index first so the order is deterministic.
std::vector<std::size_t> topologicalOrder(const std::vector<FlatNode>& flat) {
    std::vector<std::size_t> inDegree(flat.size(), 0);
    std::vector<std::vector<std::size_t>> consumers(flat.size());
    for (std::size_t i = 0; i < flat.size(); ++i) {
        for (const auto& src : flat[i].inputs) {
            if (const auto* up = std::get_if<std::size_t>(&src)) {
                consumers[*up].push_back(i);
                ++inDegree[i];
            }
        }
    }
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < flat.size(); ++i)
        if (inDegree[i] == 0) ready.insert(i);

    std::vector<std::size_t> order;
    order.reserve(flat.size());
    while (!ready.empty()) {
        const std::size_t i = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(i);
        for (std::size_t c : consumers[i])
            if (--inDegree[c] == 0) ready.insert(c);
    }
    if (order.size() != flat.size()) {
        for (std::size_t i = 0; i < flat.size(); ++i)
            if (inDegree[i] != 0) throw FlowError(ErrorKind::CycleDetected, "Flattened graph contains a cycle", flat[i].path);
    }
    return order;
}

Stamp computeStamp(const ProtoNode& node, const std::vector<ProtoNode>& earlier) {
    Stamp h = hashString(node.resolved ? node.resolved->instanceName(node.inputTypes) : node.operation);
    h = hashString(node.outputType.toString(), h);
    for (const auto& in : node.inputs) {
        if (in.isNode()) {
            h = hashCombine(h, 1);
            h = hashCombine(h, earlier[in.node()].stamp);
        } else {
            h = hashCombine(h, 2);
            h = hashCombine(h, in.literal().hash());
        }
    }
    return h;
}

} // namespace

Compiler::Compiler(const OperationCatalog& catalog, CompilerOptions options) : catalog(catalog), opts(options) {}

std::shared_ptr<const ProtoGraph> Compiler::compile(const Graph& graph) const {
    auto t0 = std::chrono::steady_clock::now();
    const Network& root = graph.root();
    Inliner inliner(graph, opts.maxInlineDepth);
    Scope rootScope;
    rootScope.network = &root;

    // Root node -> flat index of the node producing its output.
    std::map<NodeId, std::size_t> rootOutputs;
    for (const auto& [id, node] : root.nodes()) {
        FlatSource src = inliner.resolve(rootScope, id);
        if (const auto* index = std::get_if<std::size_t>(&src)) {
            rootOutputs[id] = *index;
            continue;
        }
        // A root node whose value is a bare literal still needs something to evaluate.
        FlatNode flat;
        flat.path = NodePath{id};
        flat.name = node.name;
        flat.operation = kValueOperation;
        flat.inputs.push_back(std::get<TaggedValue>(src));
        flat.declaredInputs.push_back(Type::inferred());
        flat.declaredOutput = node.outputType;
        inliner.flatNodes.push_back(std::move(flat));
        rootOutputs[id] = inliner.flatNodes.size() - 1;
    }

    std::vector<FlatNode>& flat = inliner.flatNodes;
    const std::vector<std::size_t> order = topologicalOrder(flat);
    std::vector<std::size_t> position(flat.size());
    for (std::size_t i = 0; i < order.size(); ++i) position[order[i]] = i;

    std::vector<ProtoNode> nodes;
    nodes.reserve(flat.size());
    for (std::size_t flatIndex : order) {
        FlatNode& f = flat[flatIndex];
        ProtoNode p;
        p.path = f.path;
        p.id = protoNodeIdFor(f.path);
        p.name = f.name;
        p.operation = f.operation;

        std::vector<Type> argTypes;
        for (auto& src : f.inputs) {
            if (const auto* up = std::get_if<std::size_t>(&src)) {
                const ProtoNode& upstream = nodes[position[*up]];
                p.inputs.emplace_back(position[*up]);
                argTypes.push_back(upstream.outputType);
                if (upstream.error && !p.error) p.error = *upstream.error;
            } else {
                TaggedValue& lit = std::get<TaggedValue>(src);
                argTypes.push_back(lit.type());
                p.inputs.emplace_back(std::move(lit));
            }
        }

        if (!p.error) {
            try {
                for (std::size_t k = 0; k < argTypes.size(); ++k) {
                    const Type& declared = f.declaredInputs[k];
                    if (declared.isConcrete() && declared != argTypes[k])
                        throw FlowError(ErrorKind::TypeResolutionError,
                                        fmt::format("Input {} is declared {} but receives {}", k, declared.toString(), argTypes[k].toString()));
                }
                Resolution r = catalog.resolve(f.operation, argTypes, opts.overloadPolicy);
                if (f.declaredOutput.isConcrete() && f.declaredOutput != r.outputType)
                    throw FlowError(ErrorKind::TypeResolutionError,
                                    fmt::format("Output is declared {} but {} produces {}", f.declaredOutput.toString(),
                                                r.operation->instanceName(r.inputTypes), r.outputType.toString()));
                p.resolved = r.operation;
                p.inputTypes = std::move(r.inputTypes);
                p.outputType = r.outputType;
                p.literal = r.operation->literal;
            } catch (const FlowError& e) {
                p.error = e.withNode(p.path);
                logDebug("Resolution failed for {}: {}", formatPath(p.path), e.detail());
            }
        }
        if (p.error) {
            p.inputTypes = argTypes;
            p.outputType = f.declaredOutput;
        }
        p.stamp = computeStamp(p, nodes);
        nodes.push_back(std::move(p));
    }

    std::map<NodeId, std::size_t> identity;
    for (const auto& [id, flatIndex] : rootOutputs) identity[id] = position[flatIndex];
    std::optional<std::size_t> exported;
    if (auto e = root.exported()) {
        auto it = identity.find(*e);
        if (it == identity.end()) throw FlowError(ErrorKind::DanglingReference, fmt::format("Export reads unknown node {}", *e));
        exported = it->second;
    }

    auto proto = std::make_shared<const ProtoGraph>(std::move(nodes), std::move(identity), exported);
    auto t1 = std::chrono::steady_clock::now();
    logDebug("Compiled {} root nodes into {} proto nodes ({} with errors) in {} us", root.size(), proto->size(), proto->errorCount(),
             std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
    return proto;
}

} // namespace NodeCraft
