// NodeCraft engine configuration
//
// Settings shared by the compiler, backend selector and executor. The CLI
// fills them from its options (or a CLI11 config file) and a flow file may
// carry an "engine" object with the same keys.
#pragma once
#include "NodeCraftCatalog.hpp"
#include "NodeCraftLog.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>

namespace NodeCraft {

struct EngineConfig {
    static constexpr std::size_t kMaxWorkerThreads = 256;
    static constexpr std::size_t kMaxInlineDepth = 1024;

    std::size_t workerThreads = 1;
    std::size_t maxInlineDepth = 64;
    OverloadPolicy overloadPolicy = OverloadPolicy::MostSpecific;
    bool gpuEnabled = true;
    LogLevel logLevel = LogLevel::Warn;

    // Overrides the fields present in `j`; throws std::runtime_error on
    // unknown policy or level names and on counts outside
    // [0, kMaxWorkerThreads] and [1, kMaxInlineDepth].
    void applyJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

} // namespace NodeCraft
