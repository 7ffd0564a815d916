// NodeCraft graph representation
//
// The user-editable document graph: networks of nodes whose inputs are either
// wired to another node's (single) output or hold a literal value. A node is
// implemented by a catalog operation, by a named network definition (nested
// composition), or by a parameter passthrough that exposes one of the
// enclosing network's imports.
//
// Networks reference definitions by name, never by pointer, so a graph can
// describe self-referencing definitions without creating ownership cycles;
// validate() and the compiler reject them.
#pragma once
#include "NodeCraftTypes.hpp"
#include "NodeCraftValue.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace NodeCraft {

class OperationCatalog;

struct Wire {
    NodeId node = 0;
    bool operator==(const Wire& o) const { return node == o.node; }
};

struct Literal {
    TaggedValue value;
    bool operator==(const Literal& o) const { return value == o.value; }
};

struct NodeInput {
    std::string name;
    Type declaredType;
    std::variant<Wire, Literal> source;

    bool isWire() const { return std::holds_alternative<Wire>(source); }
    const Wire* wire() const { return std::get_if<Wire>(&source); }
    const Literal* literal() const { return std::get_if<Literal>(&source); }
};

struct PrimitiveImpl {
    std::string operation; // catalog identifier, e.g. "math::add"
};

struct NetworkImpl {
    std::string definition; // name of a Graph definition
};

struct ParameterImpl {
    std::size_t importIndex = 0;
};

using Implementation = std::variant<PrimitiveImpl, NetworkImpl, ParameterImpl>;

struct Node {
    NodeId id = 0;
    std::string name;
    Implementation implementation;
    std::vector<NodeInput> inputs;
    Type outputType; // optional declaration, inferred when empty

    bool isPrimitive() const { return std::holds_alternative<PrimitiveImpl>(implementation); }
    bool isNetwork() const { return std::holds_alternative<NetworkImpl>(implementation); }
    bool isParameter() const { return std::holds_alternative<ParameterImpl>(implementation); }
    std::string describe() const;
};

// Convenience constructors for node inputs.
NodeInput wireInput(NodeId from, std::string name = {}, Type declared = Type::inferred());
NodeInput literalInput(TaggedValue value, std::string name = {}, Type declared = Type::inferred());

class Network {
public:
    // Adds a node and returns its freshly allocated id. Any id set on the
    // argument is ignored.
    NodeId addNode(Node node);
    NodeId addPrimitive(const std::string& operation, std::vector<NodeInput> inputs, std::string name = {});
    NodeId addNetworkNode(const std::string& definition, std::vector<NodeInput> inputs, std::string name = {});
    NodeId addParameter(std::size_t importIndex, std::string name = {});
    // Inserts a node keeping its id (loading documents). Throws on duplicates.
    void insertNode(Node node);
    // Removes the node. Wires that pointed at it are left dangling and
    // reported by validate().
    bool removeNode(NodeId id);

    void connect(NodeId from, NodeId to, std::size_t inputIndex);
    void disconnect(NodeId to, std::size_t inputIndex, TaggedValue replacement = TaggedValue());
    void setLiteral(NodeId node, std::size_t inputIndex, TaggedValue value);
    bool wouldCreateCycle(NodeId from, NodeId to) const;

    std::size_t addImport(Type type);
    const std::vector<Type>& imports() const { return importTypes; }
    void setImports(std::vector<Type> types) { importTypes = std::move(types); }
    void setExport(NodeId node) { exportNode = node; }
    std::optional<NodeId> exported() const { return exportNode; }

    bool contains(NodeId id) const { return nodeMap.count(id) != 0; }
    const Node* node(NodeId id) const;
    Node* node(NodeId id);
    const Node& at(NodeId id) const;
    const std::map<NodeId, Node>& nodes() const { return nodeMap; }
    std::size_t size() const { return nodeMap.size(); }
    NodeId nextNodeId() const { return nextId; }
    // Nodes whose inputs are wired to `id`.
    std::vector<NodeId> dependents(NodeId id) const;

private:
    NodeInput& inputAt(NodeId node, std::size_t inputIndex);

    std::map<NodeId, Node> nodeMap;
    std::vector<Type> importTypes;
    std::optional<NodeId> exportNode;
    NodeId nextId = 1;
};

class Graph {
public:
    Network& root() { return rootNetwork; }
    const Network& root() const { return rootNetwork; }

    void defineNetwork(const std::string& name, Network network);
    bool removeDefinition(const std::string& name);
    const Network* definition(const std::string& name) const;
    Network* definition(const std::string& name);
    const std::map<std::string, Network>& definitions() const { return library; }

    // Moves the given root nodes into a new definition named `name` and
    // replaces them with a single network node, whose id is returned. Wires
    // entering the set become imports; exactly one node of the set may feed
    // nodes outside it and becomes the export.
    NodeId extractSubNetwork(const std::set<NodeId>& nodes, const std::string& name);
    // Replaces a root network node by a copy of its definition's nodes.
    // Returns the root id the former network node's consumers now read from.
    NodeId inlineSubNetwork(NodeId networkNode);

private:
    Network rootNetwork;
    std::map<std::string, Network> library;
};

// Structural and best-effort type validation; throws FlowError with kind
// CycleDetected, DanglingReference, UnboundedRecursion or TypeIncompatible.
// When a catalog is given, primitive operations must exist in it.
void validate(const Graph& graph, const OperationCatalog* catalog = nullptr);

// Flow documents used by the CLI and tests.
Graph loadGraphFromJson(const nlohmann::json& json);
nlohmann::json graphToJson(const Graph& graph);

} // namespace NodeCraft
