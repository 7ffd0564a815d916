// NodeCraftConfig.cpp
#include "NodeCraftConfig.hpp"
#include <fmt/format.h>
#include <cstdint>
#include <stdexcept>

namespace NodeCraft {

namespace {

std::size_t countSetting(const nlohmann::json& j, const char* key, std::size_t min, std::size_t max) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) throw std::runtime_error(fmt::format("{} must be an integer", key));
    const bool inRange = v.is_number_unsigned() ? v.get<std::uint64_t>() >= min && v.get<std::uint64_t>() <= max
                                                : v.get<std::int64_t>() >= static_cast<std::int64_t>(min) &&
                                                      v.get<std::int64_t>() <= static_cast<std::int64_t>(max);
    if (!inRange) throw std::runtime_error(fmt::format("{} must be between {} and {}, got {}", key, min, max, v.dump()));
    return v.is_number_unsigned() ? static_cast<std::size_t>(v.get<std::uint64_t>()) : static_cast<std::size_t>(v.get<std::int64_t>());
}

} // namespace

void EngineConfig::applyJson(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("Engine configuration must be a JSON object");
    try {
        if (j.contains("workerThreads")) workerThreads = countSetting(j, "workerThreads", 0, kMaxWorkerThreads);
        if (j.contains("maxInlineDepth")) maxInlineDepth = countSetting(j, "maxInlineDepth", 1, kMaxInlineDepth);
        if (j.contains("overloadPolicy")) {
            const auto name = j.at("overloadPolicy").get<std::string>();
            auto policy = parseOverloadPolicy(name);
            if (!policy) throw std::runtime_error(fmt::format("Unknown overload policy '{}'", name));
            overloadPolicy = *policy;
        }
        if (j.contains("gpuEnabled")) gpuEnabled = j.at("gpuEnabled").get<bool>();
        if (j.contains("logLevel")) {
            const auto name = j.at("logLevel").get<std::string>();
            auto level = parseLogLevel(name);
            if (!level) throw std::runtime_error(fmt::format("Unknown log level '{}'", name));
            logLevel = *level;
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Invalid engine configuration: {}", e.what()));
    }
}

nlohmann::json EngineConfig::toJson() const {
    return nlohmann::json{{"workerThreads", workerThreads},
                          {"maxInlineDepth", maxInlineDepth},
                          {"overloadPolicy", overloadPolicyName(overloadPolicy)},
                          {"gpuEnabled", gpuEnabled},
                          {"logLevel", logLevelName(logLevel)}};
}

} // namespace NodeCraft
