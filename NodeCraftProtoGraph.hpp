// NodeCraft proto graph
//
// The compiler's output: a flat, topologically ordered, type-resolved list of
// operation calls. Nodes reference their inputs by index into the same list
// (always an earlier index) or embed a literal. Every proto node remembers the
// identity path of the document node it came from, which is what lets the
// executor carry cached results over to the next compilation.
#pragma once
#include "NodeCraftCatalog.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftTypes.hpp"
#include "NodeCraftValue.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace NodeCraft {

class ProtoInput {
public:
    ProtoInput(std::size_t upstream) : source(upstream) {}
    ProtoInput(TaggedValue literal) : source(std::move(literal)) {}

    bool isNode() const { return std::holds_alternative<std::size_t>(source); }
    std::size_t node() const { return std::get<std::size_t>(source); }
    const TaggedValue& literal() const { return std::get<TaggedValue>(source); }

    bool operator==(const ProtoInput& other) const { return source == other.source; }
    bool operator!=(const ProtoInput& other) const { return !(*this == other); }

private:
    std::variant<std::size_t, TaggedValue> source;
};

struct ProtoNode {
    NodePath path;
    ProtoNodeId id = 0;
    std::string name;
    std::string operation;
    const Operation* resolved = nullptr; // null when `error` is set
    std::vector<Type> inputTypes;
    Type outputType;
    std::vector<ProtoInput> inputs;
    Stamp stamp = 0;
    std::optional<FlowError> error; // resolution failure, own or inherited
    bool literal = false;

    std::string label() const;
    bool gpuEligible() const { return resolved && resolved->gpu.has_value() && !literal && !error; }
};

ProtoNodeId protoNodeIdFor(const NodePath& path);

class ProtoGraph {
public:
    ProtoGraph() = default;
    ProtoGraph(std::vector<ProtoNode> nodes, std::map<NodeId, std::size_t> identity, std::optional<std::size_t> exported);

    const std::vector<ProtoNode>& nodes() const { return protoNodes; }
    const ProtoNode& node(std::size_t index) const { return protoNodes.at(index); }
    std::size_t size() const { return protoNodes.size(); }

    std::optional<std::size_t> indexOf(ProtoNodeId id) const;
    std::optional<std::size_t> indexOfPath(const NodePath& path) const;
    // Root document node -> proto node producing its output.
    std::optional<std::size_t> indexOfRoot(NodeId id) const;
    const std::map<NodeId, std::size_t>& identityMap() const { return identity; }
    const std::vector<std::size_t>& consumers(std::size_t index) const { return consumerLists.at(index); }
    std::optional<std::size_t> exported() const { return exportIndex; }

    // Indices of `target` and everything it transitively reads, in order.
    std::vector<std::size_t> dependencyClosure(std::size_t target) const;
    // Everything that transitively reads `source`, in order.
    std::vector<std::size_t> downstreamOf(std::size_t source) const;
    std::size_t errorCount() const;

    nlohmann::json toJson() const;

private:
    std::vector<ProtoNode> protoNodes;
    std::map<NodeId, std::size_t> identity;
    std::optional<std::size_t> exportIndex;
    std::unordered_map<ProtoNodeId, std::size_t> byId;
    std::vector<std::vector<std::size_t>> consumerLists;
};

// Same nodes in the same order with the same operations, types, inputs,
// identities and stamps.
bool structurallyEqual(const ProtoGraph& a, const ProtoGraph& b);

} // namespace NodeCraft
