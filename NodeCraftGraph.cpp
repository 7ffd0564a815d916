// NodeCraftGraph.cpp
//
// Structural edits on networks, sub-network extraction/inlining and the
// validation pass run before compilation.
#include "NodeCraftGraph.hpp"
#include "NodeCraftCatalog.hpp"
#include "NodeCraftError.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace NodeCraft {

std::string Node::describe() const {
    std::string label = name.empty() ? fmt::format("#{}", id) : fmt::format("{} (#{})", name, id);
    if (auto p = std::get_if<PrimitiveImpl>(&implementation)) return fmt::format("{} [{}]", label, p->operation);
    if (auto n = std::get_if<NetworkImpl>(&implementation)) return fmt::format("{} [network {}]", label, n->definition);
    return fmt::format("{} [parameter {}]", label, std::get<ParameterImpl>(implementation).importIndex);
}

NodeInput wireInput(NodeId from, std::string name, Type declared) {
    return NodeInput{std::move(name), std::move(declared), Wire{from}};
}

NodeInput literalInput(TaggedValue value, std::string name, Type declared) {
    return NodeInput{std::move(name), std::move(declared), Literal{std::move(value)}};
}

// ---------------------------------------------------------------- Network

NodeId Network::addNode(Node node) {
    node.id = nextId++;
    const NodeId id = node.id;
    nodeMap.emplace(id, std::move(node));
    return id;
}

NodeId Network::addPrimitive(const std::string& operation, std::vector<NodeInput> inputs, std::string name) {
    Node n;
    n.name = std::move(name);
    n.implementation = PrimitiveImpl{operation};
    n.inputs = std::move(inputs);
    return addNode(std::move(n));
}

NodeId Network::addNetworkNode(const std::string& definition, std::vector<NodeInput> inputs, std::string name) {
    Node n;
    n.name = std::move(name);
    n.implementation = NetworkImpl{definition};
    n.inputs = std::move(inputs);
    return addNode(std::move(n));
}

NodeId Network::addParameter(std::size_t importIndex, std::string name) {
    Node n;
    n.name = std::move(name);
    n.implementation = ParameterImpl{importIndex};
    return addNode(std::move(n));
}

void Network::insertNode(Node node) {
    if (node.id == 0) throw std::runtime_error("Node id 0 is reserved");
    if (nodeMap.count(node.id)) throw std::runtime_error(fmt::format("Duplicate node id {}", node.id));
    nextId = std::max(nextId, node.id + 1);
    const NodeId id = node.id;
    nodeMap.emplace(id, std::move(node));
}

bool Network::removeNode(NodeId id) {
    if (!nodeMap.erase(id)) return false;
    if (exportNode && *exportNode == id) exportNode.reset();
    return true;
}

NodeInput& Network::inputAt(NodeId nodeId, std::size_t inputIndex) {
    Node* n = node(nodeId);
    if (!n) throw FlowError(ErrorKind::DanglingReference, fmt::format("node {} does not exist", nodeId), {nodeId});
    if (inputIndex >= n->inputs.size())
        throw FlowError(ErrorKind::DanglingReference, fmt::format("node {} has no input {}", n->describe(), inputIndex), {nodeId});
    return n->inputs[inputIndex];
}

void Network::connect(NodeId from, NodeId to, std::size_t inputIndex) {
    if (!contains(from)) throw FlowError(ErrorKind::DanglingReference, fmt::format("source node {} does not exist", from), {to});
    inputAt(to, inputIndex).source = Wire{from};
}

void Network::disconnect(NodeId to, std::size_t inputIndex, TaggedValue replacement) {
    inputAt(to, inputIndex).source = Literal{std::move(replacement)};
}

void Network::setLiteral(NodeId nodeId, std::size_t inputIndex, TaggedValue value) {
    inputAt(nodeId, inputIndex).source = Literal{std::move(value)};
}

bool Network::wouldCreateCycle(NodeId from, NodeId to) const {
    // An edge from -> to closes a cycle iff `from` already depends on `to`.
    std::vector<NodeId> stack{from};
    std::set<NodeId> seen;
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        if (current == to) return true;
        if (!seen.insert(current).second) continue;
        const Node* n = node(current);
        if (!n) continue;
        for (const auto& in : n->inputs)
            if (auto w = in.wire()) stack.push_back(w->node);
    }
    return false;
}

std::size_t Network::addImport(Type type) {
    importTypes.push_back(std::move(type));
    return importTypes.size() - 1;
}

const Node* Network::node(NodeId id) const {
    auto it = nodeMap.find(id);
    return it == nodeMap.end() ? nullptr : &it->second;
}

Node* Network::node(NodeId id) {
    auto it = nodeMap.find(id);
    return it == nodeMap.end() ? nullptr : &it->second;
}

const Node& Network::at(NodeId id) const {
    if (const Node* n = node(id)) return *n;
    throw FlowError(ErrorKind::DanglingReference, fmt::format("node {} does not exist", id), {id});
}

std::vector<NodeId> Network::dependents(NodeId id) const {
    std::vector<NodeId> out;
    for (const auto& [nid, n] : nodeMap) {
        for (const auto& in : n.inputs) {
            if (auto w = in.wire(); w && w->node == id) {
                out.push_back(nid);
                break;
            }
        }
    }
    return out;
}

// ---------------------------------------------------------------- Graph

void Graph::defineNetwork(const std::string& name, Network network) { library[name] = std::move(network); }

bool Graph::removeDefinition(const std::string& name) { return library.erase(name) != 0; }

const Network* Graph::definition(const std::string& name) const {
    auto it = library.find(name);
    return it == library.end() ? nullptr : &it->second;
}

Network* Graph::definition(const std::string& name) {
    auto it = library.find(name);
    return it == library.end() ? nullptr : &it->second;
}

NodeId Graph::extractSubNetwork(const std::set<NodeId>& ids, const std::string& name) {
    if (ids.empty()) throw std::runtime_error("Cannot extract an empty node set");
    if (library.count(name)) throw std::runtime_error(fmt::format("Network definition '{}' already exists", name));
    for (NodeId id : ids) rootNetwork.at(id);

    // Find the single node of the set consumed from outside (or exported).
    std::vector<NodeId> exits;
    for (NodeId id : ids) {
        bool leaves = rootNetwork.exported() && *rootNetwork.exported() == id;
        for (NodeId dep : rootNetwork.dependents(id))
            if (!ids.count(dep)) leaves = true;
        if (leaves) exits.push_back(id);
    }
    if (exits.empty()) {
        for (NodeId id : ids) {
            bool consumedInside = false;
            for (NodeId dep : rootNetwork.dependents(id))
                if (ids.count(dep)) consumedInside = true;
            if (!consumedInside) exits.push_back(id);
        }
    }
    if (exits.size() != 1)
        throw std::runtime_error(fmt::format("Extracted nodes must have exactly one output, found {}", exits.size()));
    const NodeId exitNode = exits.front();

    Network inner;
    std::vector<NodeInput> outerInputs;
    std::map<NodeId, std::size_t> importOf;
    for (NodeId id : ids) inner.insertNode(rootNetwork.at(id));
    for (NodeId id : ids) {
        Node* n = inner.node(id);
        for (auto& in : n->inputs) {
            const Wire* w = in.wire();
            if (!w || ids.count(w->node)) continue;
            auto it = importOf.find(w->node);
            if (it == importOf.end()) {
                Type t = in.declaredType;
                if (t.isInferred()) {
                    if (const Node* src = rootNetwork.node(w->node)) t = src->outputType;
                }
                std::size_t index = inner.addImport(t);
                it = importOf.emplace(w->node, index).first;
                outerInputs.push_back(wireInput(w->node, fmt::format("import{}", index), t));
            }
            in.source = Wire{inner.addParameter(it->second)};
        }
    }
    inner.setExport(exitNode);
    const Type exitType = inner.at(exitNode).outputType;
    library.emplace(name, std::move(inner));

    const bool exitWasExported = rootNetwork.exported() && *rootNetwork.exported() == exitNode;
    for (NodeId id : ids) rootNetwork.removeNode(id);
    Node outer;
    outer.name = name;
    outer.implementation = NetworkImpl{name};
    outer.inputs = std::move(outerInputs);
    outer.outputType = exitType;
    const NodeId outerId = rootNetwork.addNode(std::move(outer));
    for (NodeId dep : rootNetwork.dependents(exitNode)) {
        for (auto& in : rootNetwork.node(dep)->inputs)
            if (auto w = in.wire(); w && w->node == exitNode) in.source = Wire{outerId};
    }
    if (exitWasExported) rootNetwork.setExport(outerId);
    return outerId;
}

NodeId Graph::inlineSubNetwork(NodeId networkNode) {
    const Node outer = rootNetwork.at(networkNode);
    const auto* impl = std::get_if<NetworkImpl>(&outer.implementation);
    if (!impl) throw std::runtime_error(fmt::format("Node {} is not a network node", outer.describe()));
    const Network* def = definition(impl->definition);
    if (!def) throw FlowError(ErrorKind::DanglingReference, fmt::format("unknown network '{}'", impl->definition), {networkNode});
    if (!def->exported()) throw FlowError(ErrorKind::DanglingReference, fmt::format("network '{}' has no export", impl->definition), {networkNode});

    auto importSource = [&](std::size_t index) -> const NodeInput& {
        if (index >= outer.inputs.size())
            throw FlowError(ErrorKind::DanglingReference, fmt::format("import {} of '{}' is not bound", index, impl->definition), {networkNode});
        return outer.inputs[index];
    };

    // Parameter nodes vanish; their consumers read the outer input directly.
    std::map<NodeId, NodeId> mapped;
    for (const auto& [id, n] : def->nodes()) {
        if (n.isParameter()) continue;
        Node copy = n;
        mapped[id] = rootNetwork.addNode(std::move(copy));
    }
    auto materializeImport = [&](std::size_t index) -> NodeId {
        const NodeInput& src = importSource(index);
        if (auto w = src.wire()) return w->node;
        return rootNetwork.addPrimitive("core::value", {literalInput(src.literal()->value)}, fmt::format("{}.import{}", outer.name, index));
    };
    for (const auto& [oldId, newId] : mapped) {
        Node* n = rootNetwork.node(newId);
        for (auto& in : n->inputs) {
            const Wire* w = in.wire();
            if (!w) continue;
            const Node* target = def->node(w->node);
            if (!target)
                throw FlowError(ErrorKind::DanglingReference, fmt::format("dangling wire inside '{}'", impl->definition), {networkNode, oldId});
            if (auto p = std::get_if<ParameterImpl>(&target->implementation)) {
                in.source = importSource(p->importIndex).source;
            } else {
                in.source = Wire{mapped.at(w->node)};
            }
        }
    }

    NodeId result;
    const Node& exportNode = def->at(*def->exported());
    if (auto p = std::get_if<ParameterImpl>(&exportNode.implementation)) {
        result = materializeImport(p->importIndex);
    } else {
        result = mapped.at(exportNode.id);
    }

    const bool wasExported = rootNetwork.exported() && *rootNetwork.exported() == networkNode;
    rootNetwork.removeNode(networkNode);
    for (NodeId dep : rootNetwork.dependents(networkNode)) {
        for (auto& in : rootNetwork.node(dep)->inputs)
            if (auto w = in.wire(); w && w->node == networkNode) in.source = Wire{result};
    }
    if (wasExported) rootNetwork.setExport(result);
    return result;
}

// ---------------------------------------------------------------- validate

namespace {

struct NetworkScope {
    const Network* network;
    const std::string* definitionName; // nullptr for the root
};

std::string scopeName(const NetworkScope& scope) {
    return scope.definitionName ? fmt::format("network '{}'", *scope.definitionName) : std::string("root network");
}

void checkCycles(const NetworkScope& scope) {
    enum class Mark { None, Active, Done };
    std::unordered_map<NodeId, Mark> marks;
    // Depth-first with an explicit stack of (node, next input to follow).
    std::vector<std::pair<NodeId, std::size_t>> stack;
    for (const auto& [root, rootNode] : scope.network->nodes()) {
        if (marks[root] == Mark::Done) continue;
        marks[root] = Mark::Active;
        stack.emplace_back(root, 0);
        while (!stack.empty()) {
            auto& [id, next] = stack.back();
            const Node* n = scope.network->node(id);
            if (!n || next == n->inputs.size()) {
                marks[id] = Mark::Done;
                stack.pop_back();
                continue;
            }
            const Wire* w = n->inputs[next++].wire();
            if (!w || !scope.network->contains(w->node)) continue;
            Mark& m = marks[w->node];
            if (m == Mark::Done) continue;
            if (m == Mark::Active)
                throw FlowError(ErrorKind::CycleDetected, fmt::format("cycle through node {} in {}", w->node, scopeName(scope)), NodePath{w->node});
            m = Mark::Active;
            stack.emplace_back(w->node, 0);
        }
    }
}

Type declaredOutput(const Node& n, const OperationCatalog* catalog) {
    if (!n.outputType.isInferred()) return n.outputType;
    if (!catalog) return Type::inferred();
    if (auto p = std::get_if<PrimitiveImpl>(&n.implementation)) {
        const auto overloads = catalog->overloads(p->operation);
        if (overloads.empty()) return Type::inferred();
        const Type first = overloads.front()->signature.output;
        if (!first.isConcrete()) return Type::inferred();
        for (const auto* op : overloads)
            if (op->signature.output != first) return Type::inferred();
        return first;
    }
    return Type::inferred();
}

void checkReferences(const Graph& graph, const NetworkScope& scope, const OperationCatalog* catalog) {
    const Network& net = *scope.network;
    for (const auto& [id, n] : net.nodes()) {
        for (std::size_t i = 0; i < n.inputs.size(); ++i) {
            const NodeInput& in = n.inputs[i];
            if (auto w = in.wire()) {
                const Node* src = net.node(w->node);
                if (!src)
                    throw FlowError(ErrorKind::DanglingReference,
                                    fmt::format("input {} of {} in {} is wired to missing node {}", i, n.describe(), scopeName(scope), w->node),
                                    NodePath{id});
                const Type from = declaredOutput(*src, catalog);
                const Type& to = in.declaredType;
                if (from.isConcrete() && to.isConcrete() && from != to)
                    throw FlowError(ErrorKind::TypeIncompatible,
                                    fmt::format("{} produces {} but input {} of {} expects {}", src->describe(), from.toString(), i,
                                                n.describe(), to.toString()),
                                    NodePath{id});
            } else if (in.declaredType.isConcrete()) {
                const Type lit = in.literal()->value.type();
                if (lit != in.declaredType)
                    throw FlowError(ErrorKind::TypeIncompatible,
                                    fmt::format("literal of type {} on input {} of {} declared {}", lit.toString(), i, n.describe(),
                                                in.declaredType.toString()),
                                    NodePath{id});
            }
        }
        if (auto p = std::get_if<PrimitiveImpl>(&n.implementation)) {
            if (catalog && catalog->overloads(p->operation).empty())
                throw FlowError(ErrorKind::DanglingReference, fmt::format("unknown operation '{}'", p->operation), NodePath{id});
        } else if (auto nw = std::get_if<NetworkImpl>(&n.implementation)) {
            const Network* def = graph.definition(nw->definition);
            if (!def)
                throw FlowError(ErrorKind::DanglingReference, fmt::format("unknown network '{}'", nw->definition), NodePath{id});
            if (n.inputs.size() < def->imports().size())
                throw FlowError(ErrorKind::DanglingReference,
                                fmt::format("{} binds {} of the {} imports of '{}'", n.describe(), n.inputs.size(), def->imports().size(),
                                            nw->definition),
                                NodePath{id});
        } else {
            const auto& param = std::get<ParameterImpl>(n.implementation);
            if (!scope.definitionName)
                throw FlowError(ErrorKind::DanglingReference, fmt::format("parameter node {} outside of a network", n.describe()),
                                NodePath{id});
            if (param.importIndex >= net.imports().size())
                throw FlowError(ErrorKind::DanglingReference,
                                fmt::format("parameter {} is out of range for {}", param.importIndex, scopeName(scope)), NodePath{id});
        }
    }
    if (scope.definitionName) {
        if (!net.exported() || !net.contains(*net.exported()))
            throw FlowError(ErrorKind::DanglingReference, fmt::format("{} has no valid export", scopeName(scope)));
    } else if (net.exported() && !net.contains(*net.exported())) {
        throw FlowError(ErrorKind::DanglingReference, "root export points to a missing node");
    }
}

void checkRecursion(const Graph& graph) {
    enum class Mark { None, Active, Done };
    std::map<std::string, Mark> marks;
    std::function<void(const std::string&)> visit = [&](const std::string& name) {
        Mark& m = marks[name];
        if (m == Mark::Done) return;
        if (m == Mark::Active) throw FlowError(ErrorKind::UnboundedRecursion, fmt::format("network '{}' contains itself", name));
        m = Mark::Active;
        if (const Network* def = graph.definition(name)) {
            for (const auto& [id, n] : def->nodes())
                if (auto nw = std::get_if<NetworkImpl>(&n.implementation)) visit(nw->definition);
        }
        marks[name] = Mark::Done;
    };
    for (const auto& [name, def] : graph.definitions()) visit(name);
}

} // namespace

void validate(const Graph& graph, const OperationCatalog* catalog) {
    checkRecursion(graph);
    NetworkScope rootScope{&graph.root(), nullptr};
    checkReferences(graph, rootScope, catalog);
    checkCycles(rootScope);
    for (const auto& [name, def] : graph.definitions()) {
        NetworkScope scope{&def, &name};
        checkReferences(graph, scope, catalog);
        checkCycles(scope);
    }
}

} // namespace NodeCraft
