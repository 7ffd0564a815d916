// main.cpp
//
// Headless NodeCraft runner. Parses CLI (CLI11), loads a JSON flow, compiles
// it and evaluates the requested nodes. Literal edits given with --set are
// applied afterwards followed by an incremental recompile, so the second
// round of results shows what the cache kept.
#include "NodeCraftEngine.hpp"
#include "NodeCraftGraph.hpp"
#include "NodeCraftLog.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>

using namespace NodeCraft;

namespace {

struct LiteralEdit {
    NodeId node = 0;
    std::size_t input = 0;
    std::string text;
};

// Node references on the command line are ids or node names.
NodeId findNode(const Network& network, const std::string& ref) {
    for (const auto& [id, node] : network.nodes())
        if (node.name == ref) return id;
    char* end = nullptr;
    const unsigned long long id = std::strtoull(ref.c_str(), &end, 10);
    if (end && *end == '\0' && network.contains(id)) return id;
    throw std::runtime_error(fmt::format("No node named or numbered '{}'", ref));
}

// NODE:INPUT=TEXT, INPUT being an input name or index.
LiteralEdit parseEdit(const Network& network, const std::string& arg) {
    const auto colon = arg.find(':');
    const auto eq = arg.find('=', colon == std::string::npos ? 0 : colon);
    if (colon == std::string::npos || eq == std::string::npos) throw std::runtime_error(fmt::format("Malformed --set '{}'", arg));
    LiteralEdit edit;
    edit.node = findNode(network, arg.substr(0, colon));
    edit.text = arg.substr(eq + 1);
    const std::string input = arg.substr(colon + 1, eq - colon - 1);
    const Node& node = network.at(edit.node);
    for (std::size_t i = 0; i < node.inputs.size(); ++i) {
        if (node.inputs[i].name == input || std::to_string(i) == input) {
            edit.input = i;
            return edit;
        }
    }
    throw std::runtime_error(fmt::format("Node {} has no input '{}'", edit.node, input));
}

void applyEdit(Graph& graph, const LiteralEdit& edit) {
    Network& root = graph.root();
    const NodeInput& in = root.at(edit.node).inputs.at(edit.input);
    Type type = in.declaredType;
    if (!type.isConcrete()) {
        if (const Literal* lit = in.literal()) type = lit->value.type();
    }
    auto value = TaggedValue::fromPrimitiveString(edit.text, type);
    if (!value) throw std::runtime_error(fmt::format("Cannot read '{}' as {}", edit.text, type.toString()));
    root.setLiteral(edit.node, edit.input, *value);
}

std::string nodeLabel(const Network& network, NodeId id) {
    const Node& node = network.at(id);
    return node.name.empty() ? std::to_string(id) : node.name;
}

void printResults(FlowEngine& engine, const Network& network, const std::vector<NodeId>& targets) {
    const auto outcomes = engine.evaluateTargets(targets);
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (outcomes[i].ok()) fmt::print("{} = {}\n", nodeLabel(network, targets[i]), outcomes[i].value.toDisplayString());
        else fmt::print("{} = error: {}\n", nodeLabel(network, targets[i]), outcomes[i].error->what());
    }
}

std::string perfLine(const ExecStats& ps) {
    return nlohmann::json{{"type", "perf"},
                          {"passes", ps.passes},
                          {"operationsInvoked", ps.operationsInvoked},
                          {"literalsMaterialized", ps.literalsMaterialized},
                          {"cacheHits", ps.cacheHits},
                          {"sharedInFlight", ps.sharedInFlight},
                          {"gpuDispatches", ps.gpuDispatches},
                          {"gpuFallbacks", ps.gpuFallbacks},
                          {"failures", ps.failures},
                          {"readyQueueMax", ps.readyQueueMax},
                          {"evalTimeNsAccum", ps.evalTimeNsAccum},
                          {"evalTimeNsMax", ps.evalTimeNsMax}}
        .dump();
}

} // namespace

int main(int argc, char** argv) {
    std::string flowPath = "flows/double_add.json";
    std::vector<std::string> evalRefs;
    std::vector<std::string> setArgs;
    std::size_t workers = 1;
    std::size_t inlineDepth = 64;
    std::string policyName = "most-specific";
    std::string levelName = "warn";
    bool noGpu = false;
    bool dumpProto = false;
    std::string kernelDir;
    int benchIterations = 0;

    CLI::App app{"NodeCraft"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file");
        app.add_option("--eval", evalRefs, "Node to evaluate (id or name); defaults to the export");
        app.add_option("--set", setArgs, "Literal edit NODE:INPUT=TEXT applied before a second evaluation");
        app.add_option("--workers", workers, "Worker threads (<= 1 evaluates inline)")
            ->check(CLI::Range(std::size_t{0}, EngineConfig::kMaxWorkerThreads));
        app.add_flag("--no-gpu", noGpu, "Disable the GPU backend");
        app.add_option("--inline-depth", inlineDepth, "Maximum network inlining depth")
            ->check(CLI::Range(std::size_t{1}, EngineConfig::kMaxInlineDepth));
        app.add_option("--overload-policy", policyName, "most-specific|declaration-order|strict");
        app.add_option("--log-level", levelName, "debug|info|warn|error|off");
        app.add_flag("--dump-proto", dumpProto, "Print the compiled proto graph as JSON");
        app.add_option("--emit-kernels", kernelDir, "Write generated GPU kernel sources to this directory");
        app.add_option("--bench", benchIterations, "Recompile and evaluate N times, printing NDJSON perf lines");
        app.allow_extras(false);
        app.set_config();
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        nlohmann::json json;
        {
            std::ifstream f(flowPath);
            if (!f.good()) throw std::runtime_error("Could not find flow file: " + flowPath);
            f >> json;
        }

        EngineConfig config;
        if (json.contains("engine")) config.applyJson(json.at("engine"));
        if (app.count("--workers")) config.workerThreads = workers;
        if (app.count("--inline-depth")) config.maxInlineDepth = inlineDepth;
        if (noGpu) config.gpuEnabled = false;
        if (app.count("--overload-policy")) {
            auto policy = parseOverloadPolicy(policyName);
            if (!policy) throw std::runtime_error("Unknown overload policy: " + policyName);
            config.overloadPolicy = *policy;
        }
        if (app.count("--log-level")) {
            auto level = parseLogLevel(levelName);
            if (!level) throw std::runtime_error("Unknown log level: " + levelName);
            config.logLevel = *level;
        }
        setLogLevel(config.logLevel);
        logDebug("Engine configuration: {}", config.toJson().dump());

        Graph graph = loadGraphFromJson(json);
        OperationCatalog catalog;
        registerBuiltinOperations(catalog);
        FlowEngine engine(catalog, config);
        engine.recompile(graph);

        const Network& root = graph.root();
        std::vector<NodeId> targets;
        for (const auto& ref : evalRefs) targets.push_back(findNode(root, ref));
        if (targets.empty()) {
            if (root.exported()) targets.push_back(*root.exported());
            else
                for (const auto& [id, node] : root.nodes()) targets.push_back(id);
        }

        fmt::print("NodeCraft: flow='{}', {} nodes, {} definitions\n", flowPath, root.size(), graph.definitions().size());
        if (dumpProto) {
            nlohmann::json dump = engine.protoGraph()->toJson();
            dump["backend"] = engine.plan()->toJson();
            fmt::print("{}\n", dump.dump(2));
        }
        if (!kernelDir.empty()) {
            const std::size_t written = engine.writeKernelSources(kernelDir);
            fmt::print("Wrote {} kernel sources to {}\n", written, kernelDir);
        }

        printResults(engine, root, targets);

        if (!setArgs.empty()) {
            for (const auto& arg : setArgs) applyEdit(graph, parseEdit(graph.root(), arg));
            engine.recompile(graph);
            fmt::print("-- after {} edits\n", setArgs.size());
            printResults(engine, graph.root(), targets);
        }
        fmt::print("{}\n", perfLine(engine.getAndResetStats()));

        using clk = std::chrono::steady_clock;
        for (int i = 0; i < benchIterations; ++i) {
            auto t0 = clk::now();
            engine.recompile(graph);
            engine.evaluateTargets(targets);
            auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clk::now() - t0).count();
            auto line = nlohmann::json::parse(perfLine(engine.getAndResetStats()));
            line["iteration"] = i;
            line["cycleNs"] = ns;
            fmt::print("{}\n", line.dump());
        }
    } catch (const FlowError& e) {
        fmt::print(stderr, "nodecraft: {} ({})\n", e.what(), errorKindName(e.kind()));
        return 2;
    } catch (const std::exception& e) {
        fmt::print(stderr, "nodecraft: {}\n", e.what());
        return 1;
    }
    return 0;
}
