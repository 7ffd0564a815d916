// NodeCraftProtoGraph.cpp
#include "NodeCraftProtoGraph.hpp"
#include "NodeCraftHash.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace NodeCraft {

std::string ProtoNode::label() const {
    const std::string op = resolved ? resolved->instanceName(inputTypes) : operation;
    if (name.empty()) return fmt::format("{} {}", formatPath(path), op);
    return fmt::format("{} '{}' {}", formatPath(path), name, op);
}

ProtoNodeId protoNodeIdFor(const NodePath& path) {
    std::uint64_t h = hashU64(path.size());
    for (NodeId id : path) h = hashCombine(h, id);
    return h;
}

ProtoGraph::ProtoGraph(std::vector<ProtoNode> nodes, std::map<NodeId, std::size_t> identityMap, std::optional<std::size_t> exported)
    : protoNodes(std::move(nodes)), identity(std::move(identityMap)), exportIndex(exported) {
    consumerLists.resize(protoNodes.size());
    for (std::size_t i = 0; i < protoNodes.size(); ++i) {
        const ProtoNode& n = protoNodes[i];
        if (!byId.emplace(n.id, i).second) throw std::logic_error(fmt::format("Duplicate proto node identity {}", formatPath(n.path)));
        for (const auto& in : n.inputs) {
            if (!in.isNode()) continue;
            if (in.node() >= i) throw std::logic_error(fmt::format("Proto node {} reads a later node", n.label()));
            auto& list = consumerLists[in.node()];
            if (list.empty() || list.back() != i) list.push_back(i);
        }
    }
}

std::optional<std::size_t> ProtoGraph::indexOf(ProtoNodeId id) const {
    auto it = byId.find(id);
    if (it == byId.end()) return std::nullopt;
    return it->second;
}

std::optional<std::size_t> ProtoGraph::indexOfPath(const NodePath& path) const { return indexOf(protoNodeIdFor(path)); }

std::optional<std::size_t> ProtoGraph::indexOfRoot(NodeId id) const {
    auto it = identity.find(id);
    if (it == identity.end()) return std::nullopt;
    return it->second;
}

std::vector<std::size_t> ProtoGraph::dependencyClosure(std::size_t target) const {
    std::vector<bool> needed(protoNodes.size(), false);
    needed.at(target) = true;
    // Inputs always point backwards, so one reverse sweep suffices.
    for (std::size_t i = target + 1; i-- > 0;) {
        if (!needed[i]) continue;
        for (const auto& in : protoNodes[i].inputs)
            if (in.isNode()) needed[in.node()] = true;
    }
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i <= target; ++i)
        if (needed[i]) out.push_back(i);
    return out;
}

std::vector<std::size_t> ProtoGraph::downstreamOf(std::size_t source) const {
    std::vector<bool> reached(protoNodes.size(), false);
    reached.at(source) = true;
    std::vector<std::size_t> out;
    for (std::size_t i = source; i < protoNodes.size(); ++i) {
        if (!reached[i]) continue;
        if (i != source) out.push_back(i);
        for (std::size_t c : consumerLists[i]) reached[c] = true;
    }
    return out;
}

std::size_t ProtoGraph::errorCount() const {
    std::size_t n = 0;
    for (const auto& p : protoNodes)
        if (p.error) ++n;
    return n;
}

nlohmann::json ProtoGraph::toJson() const {
    nlohmann::json nodes = nlohmann::json::array();
    for (std::size_t i = 0; i < protoNodes.size(); ++i) {
        const ProtoNode& n = protoNodes[i];
        nlohmann::json j;
        j["index"] = i;
        j["path"] = n.path;
        j["id"] = fmt::format("{:016x}", n.id);
        if (!n.name.empty()) j["name"] = n.name;
        j["operation"] = n.resolved ? n.resolved->instanceName(n.inputTypes) : n.operation;
        j["output"] = n.outputType.toString();
        j["stamp"] = fmt::format("{:016x}", n.stamp);
        nlohmann::json inputs = nlohmann::json::array();
        for (const auto& in : n.inputs) {
            if (in.isNode()) inputs.push_back(nlohmann::json{{"node", in.node()}});
            else inputs.push_back(nlohmann::json{{"literal", in.literal().toPrimitiveString()}});
        }
        j["inputs"] = std::move(inputs);
        if (n.literal) j["literal"] = true;
        if (n.error) j["error"] = {{"kind", errorKindName(n.error->kind())}, {"node", n.error->node()}, {"message", n.error->detail()}};
        nodes.push_back(std::move(j));
    }
    nlohmann::json identityJson = nlohmann::json::object();
    for (const auto& [root, index] : identity) identityJson[std::to_string(root)] = index;
    nlohmann::json out{{"nodes", std::move(nodes)}, {"identity", std::move(identityJson)}};
    if (exportIndex) out["export"] = *exportIndex;
    return out;
}

bool structurallyEqual(const ProtoGraph& a, const ProtoGraph& b) {
    if (a.size() != b.size() || a.identityMap() != b.identityMap() || a.exported() != b.exported()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const ProtoNode& x = a.node(i);
        const ProtoNode& y = b.node(i);
        if (x.path != y.path || x.id != y.id || x.operation != y.operation || x.resolved != y.resolved || x.inputTypes != y.inputTypes ||
            x.outputType != y.outputType || x.inputs != y.inputs || x.stamp != y.stamp || x.literal != y.literal ||
            x.error.has_value() != y.error.has_value())
            return false;
        if (x.error && (x.error->kind() != y.error->kind() || x.error->node() != y.error->node())) return false;
    }
    return true;
}

} // namespace NodeCraft
