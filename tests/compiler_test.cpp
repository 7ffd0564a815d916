// Graph compiler: inlining, overload resolution, ordering, identities, stamps.
#include "NodeCraftCatalog.hpp"
#include "NodeCraftCompiler.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftExecutor.hpp"
#include "NodeCraftGraph.hpp"
#include <gtest/gtest.h>

namespace NodeCraft::tests {

namespace {

const Type F64 = Type::concrete(TypeNames::F64);

class CompilerTest : public ::testing::Test {
protected:
    void SetUp() override { registerBuiltinOperations(catalog); }

    std::shared_ptr<const ProtoGraph> compile(const Graph& g, CompilerOptions options = {})
    {
        return Compiler(catalog, options).compile(g);
    }

    // A = 5, B = double(A), C = B + 3
    Graph doubleAdd()
    {
        Graph g;
        Network& root = g.root();
        a = root.addPrimitive(kValueOperation, {literalInput(TaggedValue(5.0), "value", F64)}, "A");
        b = root.addPrimitive("math::double", {wireInput(a)}, "B");
        c = root.addPrimitive("math::add", {wireInput(b), literalInput(TaggedValue(3.0))}, "C");
        root.setExport(c);
        return g;
    }

    static Network scaleDefinition(double factor)
    {
        Network scale;
        scale.addImport(F64);
        NodeId p = scale.addParameter(0, "x");
        NodeId m = scale.addPrimitive("math::multiply", {wireInput(p), literalInput(TaggedValue(factor))}, "scaled");
        scale.setExport(m);
        return scale;
    }

    OperationCatalog catalog;
    NodeId a = 0, b = 0, c = 0;
};

ErrorKind compileError(const Compiler& compiler, const Graph& g)
{
    try {
        compiler.compile(g);
    } catch (const FlowError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "graph compiled";
    return ErrorKind::MissingInput;
}

}  // namespace

TEST_F(CompilerTest, flat_graph_in_topological_order)
{
    Graph g = doubleAdd();
    auto proto = compile(g);
    ASSERT_EQ(proto->size(), 3u);
    EXPECT_EQ(proto->errorCount(), 0u);

    const std::size_t ia = *proto->indexOfRoot(a);
    const std::size_t ib = *proto->indexOfRoot(b);
    const std::size_t ic = *proto->indexOfRoot(c);
    EXPECT_LT(ia, ib);
    EXPECT_LT(ib, ic);
    EXPECT_EQ(*proto->exported(), ic);

    EXPECT_TRUE(proto->node(ia).literal);
    EXPECT_FALSE(proto->node(ib).literal);
    EXPECT_EQ(proto->node(ib).outputType, F64);
    EXPECT_EQ(proto->node(ic).resolved->instanceName(proto->node(ic).inputTypes), "math::add<f64,f64>");
    EXPECT_EQ(proto->node(ic).path, NodePath{c});
    ASSERT_TRUE(proto->node(ic).inputs[0].isNode());
    EXPECT_EQ(proto->node(ic).inputs[0].node(), ib);
    EXPECT_EQ(proto->node(ic).inputs[1].literal(), TaggedValue(3.0));
    EXPECT_EQ(proto->consumers(ib), std::vector<std::size_t>{ic});
}

TEST_F(CompilerTest, compilation_is_deterministic)
{
    Graph g = doubleAdd();
    auto first = compile(g);
    auto second = compile(g);
    EXPECT_TRUE(structurallyEqual(*first, *second));
    EXPECT_EQ(first->toJson(), second->toJson());

    g.root().setLiteral(c, 1, TaggedValue(4.0));
    EXPECT_FALSE(structurallyEqual(*first, *compile(g)));
}

TEST_F(CompilerTest, stamps_follow_content)
{
    Graph g = doubleAdd();
    auto before = compile(g);

    g.root().setLiteral(c, 1, TaggedValue(4.0));
    auto tail = compile(g);
    EXPECT_EQ(before->node(0).stamp, tail->node(0).stamp);
    EXPECT_EQ(before->node(1).stamp, tail->node(1).stamp);
    EXPECT_NE(before->node(2).stamp, tail->node(2).stamp);

    g.root().setLiteral(a, 0, TaggedValue(10.0));
    auto head = compile(g);
    for (std::size_t i = 0; i < 3; ++i) EXPECT_NE(tail->node(i).stamp, head->node(i).stamp) << i;
    // Identities do not depend on content.
    for (std::size_t i = 0; i < 3; ++i) EXPECT_EQ(tail->node(i).id, head->node(i).id) << i;
}

TEST_F(CompilerTest, network_nodes_are_inlined_with_identity_paths)
{
    Graph g;
    g.defineNetwork("scale", scaleDefinition(2.0));
    Network& root = g.root();
    NodeId src = root.addPrimitive(kValueOperation, {literalInput(TaggedValue(4.0))});
    NodeId first = root.addNetworkNode("scale", {wireInput(src)});
    NodeId second = root.addNetworkNode("scale", {wireInput(first)});

    auto proto = compile(g);
    ASSERT_EQ(proto->size(), 3u);
    const NodeId multiply = *g.definition("scale")->exported();
    auto i1 = proto->indexOfPath({first, multiply});
    auto i2 = proto->indexOfPath({second, multiply});
    ASSERT_TRUE(i1 && i2);
    EXPECT_EQ(*proto->indexOfRoot(first), *i1);
    EXPECT_EQ(*proto->indexOfRoot(second), *i2);
    EXPECT_EQ(proto->node(*i2).inputs[0].node(), *i1);
    EXPECT_EQ(proto->node(*i1).inputs[0].node(), *proto->indexOfRoot(src));
    EXPECT_NE(proto->node(*i1).id, proto->node(*i2).id);
}

TEST_F(CompilerTest, nested_definitions_extend_the_path)
{
    Graph g;
    g.defineNetwork("scale", scaleDefinition(2.0));
    Network quad;
    quad.addImport(F64);
    NodeId p = quad.addParameter(0);
    NodeId s1 = quad.addNetworkNode("scale", {wireInput(p)});
    NodeId s2 = quad.addNetworkNode("scale", {wireInput(s1)});
    quad.setExport(s2);
    g.defineNetwork("quad", std::move(quad));
    NodeId q = g.root().addNetworkNode("quad", {literalInput(TaggedValue(1.5))});

    auto proto = compile(g);
    ASSERT_EQ(proto->size(), 2u);
    const NodeId multiply = *g.definition("scale")->exported();
    auto inner = proto->indexOfPath({q, s2, multiply});
    ASSERT_TRUE(inner);
    EXPECT_EQ(*proto->indexOfRoot(q), *inner);
    // The literal import is embedded in the first multiply.
    auto outer = proto->indexOfPath({q, s1, multiply});
    ASSERT_TRUE(outer);
    EXPECT_EQ(proto->node(*outer).inputs[0].literal(), TaggedValue(1.5));
}

TEST_F(CompilerTest, passthrough_networks_map_to_their_source)
{
    Graph g;
    Network pass;
    pass.addImport(F64);
    pass.setExport(pass.addParameter(0));
    g.defineNetwork("pass", std::move(pass));
    Network& root = g.root();
    NodeId src = root.addPrimitive("math::negate", {literalInput(TaggedValue(2.0))});
    NodeId wired = root.addNetworkNode("pass", {wireInput(src)});
    NodeId literal = root.addNetworkNode("pass", {literalInput(TaggedValue(7.0))});

    auto proto = compile(g);
    EXPECT_EQ(*proto->indexOfRoot(wired), *proto->indexOfRoot(src));
    const ProtoNode& synthesized = proto->node(*proto->indexOfRoot(literal));
    EXPECT_EQ(synthesized.operation, kValueOperation);
    EXPECT_TRUE(synthesized.literal);
    EXPECT_EQ(synthesized.path, NodePath{literal});
}

TEST_F(CompilerTest, unbounded_recursion_stops_at_depth_limit)
{
    Graph g;
    Network loop;
    loop.addImport(F64);
    NodeId p = loop.addParameter(0);
    loop.setExport(loop.addNetworkNode("loop", {wireInput(p)}));
    g.defineNetwork("loop", std::move(loop));
    g.root().addNetworkNode("loop", {literalInput(TaggedValue(1.0))});

    CompilerOptions options;
    options.maxInlineDepth = 8;
    EXPECT_EQ(compileError(Compiler(catalog, options), g), ErrorKind::UnboundedRecursion);
}

TEST_F(CompilerTest, cycles_produce_no_proto_graph)
{
    Graph g = doubleAdd();
    g.root().node(a)->implementation = PrimitiveImpl{"math::double"};
    g.root().connect(b, a, 0);
    EXPECT_EQ(compileError(Compiler(catalog), g), ErrorKind::CycleDetected);
}

TEST_F(CompilerTest, long_chain_wired_against_id_order)
{
    // Each node reads the next one, so the chain runs from the highest id down.
    constexpr std::size_t kLength = 50000;
    Graph g;
    Network& root = g.root();
    std::vector<NodeId> ids;
    for (std::size_t i = 0; i < kLength; ++i) ids.push_back(root.addPrimitive("math::negate", {literalInput(TaggedValue(1.0))}));
    for (std::size_t i = 0; i + 1 < kLength; ++i) root.connect(ids[i + 1], ids[i], 0);

    EXPECT_NO_THROW(validate(g, &catalog));
    auto proto = compile(g);
    ASSERT_EQ(proto->size(), kLength);
    EXPECT_EQ(*proto->indexOfRoot(ids.back()), 0u);
    EXPECT_EQ(*proto->indexOfRoot(ids.front()), kLength - 1);

    Executor executor;
    executor.adopt(proto);
    EXPECT_EQ(executor.evaluate(*proto->indexOfRoot(ids.front())).get<double>(), 1.0);

    // Closing the chain is still found, both by validation and by the compiler.
    root.connect(ids.front(), ids.back(), 0);
    try {
        validate(g, &catalog);
        ADD_FAILURE() << "cycle validated";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CycleDetected);
    }
    EXPECT_EQ(compileError(Compiler(catalog), g), ErrorKind::CycleDetected);
}

TEST_F(CompilerTest, resolution_errors_are_markers_inherited_downstream)
{
    Graph g;
    Network& root = g.root();
    NodeId bad = root.addPrimitive("math::add", {literalInput(TaggedValue(std::string("x"))), literalInput(TaggedValue(1.0))});
    NodeId after = root.addPrimitive("math::negate", {wireInput(bad)});
    NodeId fine = root.addPrimitive("math::negate", {literalInput(TaggedValue(1.0))});

    auto proto = compile(g);
    EXPECT_EQ(proto->errorCount(), 2u);
    const ProtoNode& own = proto->node(*proto->indexOfRoot(bad));
    ASSERT_TRUE(own.error.has_value());
    EXPECT_EQ(own.error->kind(), ErrorKind::TypeResolutionError);
    EXPECT_EQ(own.error->node(), NodePath{bad});
    EXPECT_EQ(own.resolved, nullptr);

    const ProtoNode& inherited = proto->node(*proto->indexOfRoot(after));
    ASSERT_TRUE(inherited.error.has_value());
    EXPECT_EQ(inherited.error->node(), NodePath{bad});
    EXPECT_FALSE(proto->node(*proto->indexOfRoot(fine)).error.has_value());
}

TEST_F(CompilerTest, declared_types_constrain_resolution)
{
    Graph g;
    Network& root = g.root();
    NodeId n = root.addPrimitive("math::double", {literalInput(TaggedValue(std::uint32_t{3}))});
    root.node(n)->outputType = F64;
    auto proto = compile(g);
    ASSERT_TRUE(proto->node(0).error.has_value());
    EXPECT_EQ(proto->node(0).error->kind(), ErrorKind::TypeResolutionError);
}

TEST_F(CompilerTest, generic_operations_bind_their_parameters)
{
    Graph g;
    Network& root = g.root();
    NodeId id = root.addPrimitive("core::identity", {literalInput(TaggedValue(F64Array{1, 2}))});
    auto proto = compile(g);
    EXPECT_EQ(proto->node(*proto->indexOfRoot(id)).outputType, Type::concrete(TypeNames::F64Array));
}

namespace {

// pick(f64, 'T) and pick('T, f64) tie for (f64, f64); pick('T, 'U) is the
// least specific and declared first.
void registerPick(OperationCatalog& catalog)
{
    auto tag = [](const char* name) { return [name](const std::vector<Value>&) { return Value::make(std::string(name)); }; };
    const Type S = Type::concrete(TypeNames::String);
    catalog.registerOperation("test::pick", {{Type::generic("T"), Type::generic("U")}, S}, tag("generic"));
    catalog.registerOperation("test::pick", {{F64, Type::generic("T")}, S}, tag("left"));
    catalog.registerOperation("test::pick", {{Type::generic("T"), F64}, S}, tag("right"));
}

Graph pickGraph()
{
    Graph g;
    g.root().addPrimitive("test::pick", {literalInput(TaggedValue(1.0)), literalInput(TaggedValue(2.0))});
    return g;
}

}  // namespace

TEST(overload_policy, most_specific_prefers_first_declared_on_ties)
{
    OperationCatalog catalog;
    registerPick(catalog);
    CompilerOptions options;
    options.overloadPolicy = OverloadPolicy::MostSpecific;
    auto proto = Compiler(catalog, options).compile(pickGraph());
    ASSERT_FALSE(proto->node(0).error.has_value());
    EXPECT_EQ(proto->node(0).resolved->signature.inputs[0], F64);
    EXPECT_TRUE(proto->node(0).resolved->signature.inputs[1].isGeneric());
}

TEST(overload_policy, declaration_order_takes_first_match)
{
    OperationCatalog catalog;
    registerPick(catalog);
    CompilerOptions options;
    options.overloadPolicy = OverloadPolicy::DeclarationOrder;
    auto proto = Compiler(catalog, options).compile(pickGraph());
    EXPECT_EQ(proto->node(0).resolved->signature.specificity(), 0u);
}

TEST(overload_policy, strict_reports_ambiguity)
{
    OperationCatalog catalog;
    registerPick(catalog);
    CompilerOptions options;
    options.overloadPolicy = OverloadPolicy::Strict;
    auto proto = Compiler(catalog, options).compile(pickGraph());
    ASSERT_TRUE(proto->node(0).error.has_value());
    EXPECT_EQ(proto->node(0).error->kind(), ErrorKind::AmbiguousOverload);
}

TEST(overload_policy, names_round_trip)
{
    for (auto p : {OverloadPolicy::MostSpecific, OverloadPolicy::DeclarationOrder, OverloadPolicy::Strict})
        EXPECT_EQ(*parseOverloadPolicy(overloadPolicyName(p)), p);
    EXPECT_FALSE(parseOverloadPolicy("random").has_value());
}

}  // namespace NodeCraft::tests
