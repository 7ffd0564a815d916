// FlowEngine: recompilation, document-level evaluation, configuration and
// the sample flows.
#include "NodeCraftEngine.hpp"
#include "NodeCraftError.hpp"
#include "NodeCraftGraph.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace NodeCraft::tests {

namespace {

nlohmann::json loadFlow(const std::string& name)
{
    std::ifstream in(std::string(NODECRAFT_FLOWS_DIR) + "/" + name);
    EXPECT_TRUE(in.good()) << name;
    return nlohmann::json::parse(in);
}

EngineConfig cpuConfig()
{
    EngineConfig config;
    config.gpuEnabled = false;
    return config;
}

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        registerBuiltinOperations(catalog);
        Network& root = graph.root();
        a = root.addPrimitive(kValueOperation, {literalInput(TaggedValue(5.0), "value", Type::concrete(TypeNames::F64))}, "A");
        b = root.addPrimitive("math::double", {wireInput(a)}, "B");
        c = root.addPrimitive("math::add", {wireInput(b), literalInput(TaggedValue(3.0))}, "C");
        root.setExport(c);
    }

    OperationCatalog catalog;
    Graph graph;
    NodeId a = 0, b = 0, c = 0;
};

}  // namespace

TEST_F(EngineTest, recompile_and_evaluate)
{
    FlowEngine engine(catalog, cpuConfig());
    EXPECT_EQ(engine.gpuContext(), nullptr);
    EXPECT_THROW(engine.evaluate(c), std::runtime_error);

    engine.recompile(graph);
    EXPECT_DOUBLE_EQ(engine.evaluateExport().get<double>(), 13.0);
    graph.root().setLiteral(a, 0, TaggedValue(10.0));
    engine.recompile(graph);
    EXPECT_DOUBLE_EQ(engine.evaluate(c).get<double>(), 23.0);
    EXPECT_EQ(engine.executionCount(b), 2u);
    EXPECT_EQ(engine.executionCount(c), 2u);
    EXPECT_EQ(engine.recompileCount(), 2u);
}

TEST_F(EngineTest, failed_recompile_keeps_previous_generation)
{
    FlowEngine engine(catalog, cpuConfig());
    engine.recompile(graph);
    auto before = engine.protoGraph();

    Graph cyclic = graph;
    cyclic.root().node(a)->implementation = PrimitiveImpl{"math::double"};
    cyclic.root().connect(b, a, 0);
    try {
        engine.recompile(cyclic);
        FAIL() << "cycle accepted";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CycleDetected);
        EXPECT_EQ(e.category(), ErrorCategory::Structural);
    }
    EXPECT_EQ(engine.protoGraph(), before);
    EXPECT_DOUBLE_EQ(engine.evaluate(c).get<double>(), 13.0);
    EXPECT_EQ(engine.recompileCount(), 1u);

    Graph unknown = graph;
    unknown.root().addPrimitive("math::nope", {});
    EXPECT_THROW(engine.recompile(unknown), FlowError);
    EXPECT_EQ(engine.protoGraph(), before);
}

TEST_F(EngineTest, targets_fail_independently)
{
    NodeId fail = graph.root().addPrimitive("debug::fail", {wireInput(a)});
    FlowEngine engine(catalog, cpuConfig());
    engine.recompile(graph);

    auto outcomes = engine.evaluateTargets({c, fail, 999});
    ASSERT_EQ(outcomes.size(), 3u);
    ASSERT_TRUE(outcomes[0].ok());
    EXPECT_DOUBLE_EQ(outcomes[0].value.get<double>(), 13.0);
    ASSERT_FALSE(outcomes[1].ok());
    EXPECT_EQ(outcomes[1].error->kind(), ErrorKind::OperationPanic);
    EXPECT_EQ(outcomes[1].error->node(), NodePath{fail});
    ASSERT_FALSE(outcomes[2].ok());
    EXPECT_EQ(outcomes[2].error->kind(), ErrorKind::DanglingReference);

    EXPECT_FALSE(engine.tryEvaluate(999).ok());
    EXPECT_THROW(engine.evaluate(999), FlowError);
}

TEST(engine_flows, double_add)
{
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    nlohmann::json flow = loadFlow("double_add.json");
    EngineConfig config;
    config.applyJson(flow.at("engine"));
    EXPECT_FALSE(config.gpuEnabled);

    Graph graph = loadGraphFromJson(flow);
    FlowEngine engine(catalog, config);
    engine.recompile(graph);
    EXPECT_DOUBLE_EQ(engine.evaluateExport().get<double>(), 13.0);
    EXPECT_EQ(engine.protoGraph()->size(), 3u);
    EXPECT_TRUE(engine.plan()->segments().empty());
}

TEST(engine_flows, wave_mix_runs_on_the_gpu_backend)
{
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    nlohmann::json flow = loadFlow("wave_mix.json");
    EngineConfig config;
    config.applyJson(flow.at("engine"));
    EXPECT_EQ(config.workerThreads, 4u);

    Graph graph = loadGraphFromJson(flow);
    FlowEngine engine(catalog, config);
    ASSERT_NE(engine.gpuContext(), nullptr);
    engine.recompile(graph);
    ASSERT_EQ(engine.plan()->segments().size(), 1u);
    EXPECT_EQ(engine.plan()->gpuNodeCount(), 3u);

    const NodeId total = 5;
    EXPECT_NEAR(engine.evaluate(total).get<double>(), 1.75, 1e-12);
    // The multiply inside the scale_bias instance on node 3.
    const F64Array scaled = engine.evaluatePath({3, 3}).get<F64Array>();
    ASSERT_EQ(scaled.size(), 5u);
    EXPECT_DOUBLE_EQ(scaled[4], 0.5);
    EXPECT_NO_THROW(engine.evaluatePath({3}));
    EXPECT_THROW(engine.evaluatePath({3, 42}), FlowError);

    const ExecStats stats = engine.getAndResetStats();
    EXPECT_EQ(stats.gpuDispatches, 1u);
    EXPECT_EQ(stats.gpuFallbacks, 0u);
}

TEST(engine_flows, kernel_sources_are_written)
{
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    Graph graph = loadGraphFromJson(loadFlow("wave_mix.json"));
    FlowEngine engine(catalog);
    engine.recompile(graph);

    const auto dir = std::filesystem::temp_directory_path() / "nodecraft_kernel_test";
    std::filesystem::remove_all(dir);
    ASSERT_EQ(engine.writeKernelSources(dir.string()), 1u);
    const auto file = dir / (engine.plan()->segments().front().pipeline->name() + ".comp");
    ASSERT_TRUE(std::filesystem::exists(file));
    std::ifstream in(file);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("void main()"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(engine_config, json_round_trip)
{
    EngineConfig config;
    config.workerThreads = 3;
    config.overloadPolicy = OverloadPolicy::Strict;
    config.logLevel = LogLevel::Debug;

    EngineConfig copy;
    copy.applyJson(config.toJson());
    EXPECT_EQ(copy.workerThreads, 3u);
    EXPECT_EQ(copy.overloadPolicy, OverloadPolicy::Strict);
    EXPECT_EQ(copy.logLevel, LogLevel::Debug);
    EXPECT_TRUE(copy.gpuEnabled);

    // Keys that are absent keep their current values.
    copy.applyJson(nlohmann::json{{"gpuEnabled", false}});
    EXPECT_EQ(copy.workerThreads, 3u);
    EXPECT_FALSE(copy.gpuEnabled);
}

TEST(engine_config, rejects_bad_values)
{
    EngineConfig config;
    EXPECT_THROW(config.applyJson(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"overloadPolicy", "random"}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"logLevel", "loud"}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"maxInlineDepth", 0}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"workerThreads", "many"}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"workerThreads", -1}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"workerThreads", EngineConfig::kMaxWorkerThreads + 1}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"workerThreads", 2.5}}), std::runtime_error);
    EXPECT_THROW(config.applyJson(nlohmann::json{{"maxInlineDepth", -3}}), std::runtime_error);
    EXPECT_EQ(config.workerThreads, 1u);

    config.applyJson(nlohmann::json{{"workerThreads", 0}, {"maxInlineDepth", EngineConfig::kMaxInlineDepth}});
    EXPECT_EQ(config.workerThreads, 0u);
    EXPECT_EQ(config.maxInlineDepth, EngineConfig::kMaxInlineDepth);
}

TEST(engine_config, inline_depth_reaches_the_compiler)
{
    OperationCatalog catalog;
    registerBuiltinOperations(catalog);
    Graph graph;
    Network inner;
    inner.addImport(Type::concrete(TypeNames::F64));
    inner.setExport(inner.addPrimitive("math::negate", {wireInput(inner.addParameter(0))}));
    graph.defineNetwork("inner", std::move(inner));
    Network outer;
    outer.addImport(Type::concrete(TypeNames::F64));
    outer.setExport(outer.addNetworkNode("inner", {wireInput(outer.addParameter(0))}));
    graph.defineNetwork("outer", std::move(outer));
    NodeId top = graph.root().addNetworkNode("outer", {literalInput(TaggedValue(2.0))});

    EngineConfig shallow = cpuConfig();
    shallow.maxInlineDepth = 1;
    FlowEngine limited(catalog, shallow);
    try {
        limited.recompile(graph);
        FAIL() << "depth limit ignored";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnboundedRecursion);
    }

    FlowEngine engine(catalog, cpuConfig());
    engine.recompile(graph);
    EXPECT_DOUBLE_EQ(engine.evaluate(top).get<double>(), -2.0);
}

}  // namespace NodeCraft::tests
