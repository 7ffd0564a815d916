// Document graph: edits, validation, sub-network extraction, JSON documents.
#include "NodeCraftCatalog.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftGraph.hpp"
#include <gtest/gtest.h>

namespace NodeCraft::tests {

namespace {

const Type F64 = Type::concrete(TypeNames::F64);

ErrorKind validationError(const Graph& graph, const OperationCatalog* catalog = nullptr)
{
    try {
        validate(graph, catalog);
    } catch (const FlowError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "graph validated";
    return ErrorKind::MissingInput;
}

// A = 5, B = double(A), C = B + 3
Graph doubleAdd(NodeId& a, NodeId& b, NodeId& c)
{
    Graph g;
    Network& root = g.root();
    a = root.addPrimitive(kValueOperation, {literalInput(TaggedValue(5.0), "value", F64)}, "A");
    b = root.addPrimitive("math::double", {wireInput(a, "x")}, "B");
    c = root.addPrimitive("math::add", {wireInput(b, "a"), literalInput(TaggedValue(3.0), "b")}, "C");
    root.setExport(c);
    return g;
}

}  // namespace

TEST(graph, ids_are_allocated_and_never_reused)
{
    Network net;
    NodeId a = net.addPrimitive("math::negate", {literalInput(TaggedValue(1.0))});
    NodeId b = net.addPrimitive("math::negate", {wireInput(a)});
    EXPECT_NE(a, b);
    EXPECT_TRUE(net.removeNode(b));
    NodeId c = net.addPrimitive("math::negate", {wireInput(a)});
    EXPECT_NE(c, b);
    EXPECT_EQ(net.dependents(a), std::vector<NodeId>{c});
}

TEST(graph, connect_and_literal_edits)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    Network& root = g.root();
    root.setLiteral(a, 0, TaggedValue(10.0));
    EXPECT_EQ(root.at(a).inputs[0].literal()->value, TaggedValue(10.0));

    root.disconnect(c, 0, TaggedValue(1.0));
    EXPECT_FALSE(root.at(c).inputs[0].isWire());
    root.connect(a, c, 0);
    EXPECT_EQ(root.at(c).inputs[0].wire()->node, a);

    EXPECT_TRUE(root.wouldCreateCycle(c, a));
    EXPECT_FALSE(root.wouldCreateCycle(a, c));

    EXPECT_THROW(root.connect(999, c, 0), FlowError);
    EXPECT_THROW(root.setLiteral(c, 7, TaggedValue(1.0)), FlowError);
}

TEST(graph, validate_accepts_well_formed_graph)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    EXPECT_NO_THROW(validate(g, &catalog));
}

TEST(graph, validate_reports_two_node_cycle)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    Network& root = g.root();
    Node* nodeA = root.node(a);
    nodeA->implementation = PrimitiveImpl{"math::double"};
    root.connect(b, a, 0);
    EXPECT_EQ(validationError(g), ErrorKind::CycleDetected);
}

TEST(graph, validate_reports_dangling_wire_and_unknown_operation)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    g.root().removeNode(a);
    EXPECT_EQ(validationError(g), ErrorKind::DanglingReference);

    Graph h = doubleAdd(a, b, c);
    h.root().addPrimitive("math::no_such_op", {literalInput(TaggedValue(1.0))});
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    EXPECT_NO_THROW(validate(h));
    EXPECT_EQ(validationError(h, &catalog), ErrorKind::DanglingReference);
}

TEST(graph, validate_reports_literal_type_conflict)
{
    Graph g;
    g.root().addPrimitive("math::negate", {literalInput(TaggedValue(std::string("x")), "x", F64)});
    EXPECT_EQ(validationError(g), ErrorKind::TypeIncompatible);
}

TEST(graph, validate_reports_self_containing_network)
{
    Graph g;
    Network loop;
    loop.addImport(F64);
    NodeId p = loop.addParameter(0);
    NodeId inner = loop.addNetworkNode("loop", {wireInput(p)});
    loop.setExport(inner);
    g.defineNetwork("loop", std::move(loop));
    g.root().addNetworkNode("loop", {literalInput(TaggedValue(1.0))});
    EXPECT_EQ(validationError(g), ErrorKind::UnboundedRecursion);
}

TEST(graph, extract_then_inline_keeps_the_wiring)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    const NodeId net = g.extractSubNetwork({b, c}, "double_plus_three");

    const Network& root = g.root();
    EXPECT_FALSE(root.contains(b));
    EXPECT_FALSE(root.contains(c));
    ASSERT_TRUE(root.at(net).isNetwork());
    EXPECT_EQ(*root.exported(), net);
    const Network* def = g.definition("double_plus_three");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->imports().size(), 1u);
    EXPECT_EQ(*def->exported(), c);
    ASSERT_EQ(root.at(net).inputs.size(), 1u);
    EXPECT_EQ(root.at(net).inputs[0].wire()->node, a);
    EXPECT_NO_THROW(validate(g));

    const NodeId result = g.inlineSubNetwork(net);
    EXPECT_FALSE(g.root().contains(net));
    EXPECT_EQ(*g.root().exported(), result);
    const Node& add = g.root().at(result);
    ASSERT_TRUE(add.inputs[0].isWire());
    const Node& dbl = g.root().at(add.inputs[0].wire()->node);
    EXPECT_EQ(std::get<PrimitiveImpl>(dbl.implementation).operation, "math::double");
    EXPECT_EQ(dbl.inputs[0].wire()->node, a);
    EXPECT_NO_THROW(validate(g));
}

TEST(graph, extract_rejects_multiple_outputs)
{
    NodeId a, b, c;
    Graph g = doubleAdd(a, b, c);
    g.root().addPrimitive("math::negate", {wireInput(a)});
    EXPECT_THROW(g.extractSubNetwork({a, b}, "two_outputs"), std::runtime_error);
    EXPECT_THROW(g.inlineSubNetwork(a), std::runtime_error);
}

TEST(graph, json_document_round_trip)
{
    const nlohmann::json doc = R"({
      "nodes": [
        {"id": 1, "name": "A", "operation": "core::value", "inputs": [{"name": "value", "type": "f64", "value": 5}]},
        {"id": 2, "name": "S", "network": "scale", "inputs": [{"node": 1}]},
        {"id": 3, "name": "L", "operation": "text::concat", "inputs": [{"type": "string", "value": "a"}, {"type": "string", "value": "b"}]}
      ],
      "export": 2,
      "definitions": {
        "scale": {"imports": ["f64"], "export": 2, "nodes": [
          {"id": 1, "parameter": 0},
          {"id": 2, "operation": "math::multiply", "inputs": [{"node": 1}, {"type": "f64", "value": 2.0}]}
        ]}
      }
    })"_json;

    Graph g = loadGraphFromJson(doc);
    EXPECT_EQ(g.root().size(), 3u);
    EXPECT_EQ(*g.root().exported(), 2u);
    ASSERT_NE(g.definition("scale"), nullptr);
    EXPECT_EQ(g.root().at(1).inputs[0].literal()->value, TaggedValue(5.0));
    EXPECT_EQ(g.root().nextNodeId(), 4u);

    Graph again = loadGraphFromJson(graphToJson(g));
    EXPECT_EQ(graphToJson(again), graphToJson(g));
}

TEST(graph, json_rejects_malformed_documents)
{
    EXPECT_THROW(loadGraphFromJson(R"({"nodes": [{"id": 1}]})"_json), std::runtime_error);
    EXPECT_THROW(loadGraphFromJson(R"({"nodes": [{"id": 1, "operation": "x"}, {"id": 1, "operation": "y"}]})"_json),
                 std::runtime_error);
    EXPECT_THROW(loadGraphFromJson(R"({"nodes": [{"id": 1, "operation": "x", "inputs": [{"type": "u32", "value": "nope"}]}]})"_json),
                 std::runtime_error);
}

TEST(graph, json_unsigned_literals_are_range_checked)
{
    auto load = [](const char* type, const nlohmann::json& value) {
        nlohmann::json input;
        input["type"] = type;
        input["value"] = value;
        nlohmann::json node;
        node["id"] = 1;
        node["operation"] = kValueOperation;
        node["inputs"] = nlohmann::json::array();
        node["inputs"].push_back(input);
        nlohmann::json doc;
        doc["nodes"] = nlohmann::json::array();
        doc["nodes"].push_back(node);
        return loadGraphFromJson(doc).root().at(1).inputs[0].literal()->value;
    };
    EXPECT_EQ(load("u32", 4294967295u), TaggedValue(std::uint32_t{4294967295u}));
    EXPECT_EQ(load("u64", 18446744073709551615ull), TaggedValue(std::uint64_t{18446744073709551615ull}));
    EXPECT_EQ(load("u32", 7.0), TaggedValue(std::uint32_t{7}));
    EXPECT_THROW(load("u32", 4294967296ull), std::runtime_error);
    EXPECT_THROW(load("u64", -1), std::runtime_error);
    EXPECT_THROW(load("u32", 1.5), std::runtime_error);
    try {
        load("u32", -1);
        ADD_FAILURE() << "-1 loaded as u32";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Numeric literal out of range"), std::string::npos);
    }
}

TEST(graph, json_color_literals_keep_their_channels)
{
    const Color tint{0.1f, 0.2f, 0.3f, 0.45f};
    Raster raster;
    raster.width = 2;
    raster.height = 1;
    raster.pixels = {tint, Color{1.0f, 0.5f, 0.25f, 1.0f}};

    Graph g;
    NodeId color = g.root().addPrimitive(kValueOperation, {literalInput(TaggedValue(tint))});
    NodeId image = g.root().addPrimitive(kValueOperation, {literalInput(TaggedValue(raster))});
    Graph again = loadGraphFromJson(graphToJson(g));

    const TaggedValue& loaded = again.root().at(color).inputs[0].literal()->value;
    EXPECT_EQ(loaded, TaggedValue(tint));
    EXPECT_EQ(loaded.hash(), TaggedValue(tint).hash());
    EXPECT_EQ(again.root().at(image).inputs[0].literal()->value, TaggedValue(raster));

    // Hex strings are still accepted on load.
    Graph hex = loadGraphFromJson(R"({"nodes": [{"id": 1, "operation": "core::value", "inputs": [{"type": "color", "value": "#ff000080"}]}]})"_json);
    const Color* red = hex.root().at(1).inputs[0].literal()->value.tryGet<Color>();
    ASSERT_NE(red, nullptr);
    EXPECT_EQ(red->r, 1.0f);
    EXPECT_THROW(loadGraphFromJson(R"({"nodes": [{"id": 1, "operation": "core::value", "inputs": [{"type": "color", "value": [1, 0]}]}]})"_json),
                 std::runtime_error);
}

}  // namespace NodeCraft::tests
