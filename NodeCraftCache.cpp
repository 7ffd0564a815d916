// NodeCraftCache.cpp
#include "NodeCraftCache.hpp"

namespace NodeCraft {

std::optional<Value> ResultCache::lookup(ProtoNodeId id, Stamp stamp) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(id);
    if (it == entries.end() || it->second.stamp != stamp) return std::nullopt;
    return it->second.value;
}

void ResultCache::store(ProtoNodeId id, Stamp stamp, Value value) {
    std::lock_guard<std::mutex> lock(mutex);
    entries[id] = Entry{stamp, std::move(value)};
}

bool ResultCache::contains(ProtoNodeId id, Stamp stamp) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(id);
    return it != entries.end() && it->second.stamp == stamp;
}

std::size_t ResultCache::retain(const ProtoGraph& graph) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t evicted = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        auto index = graph.indexOf(it->first);
        if (!index || graph.node(*index).stamp != it->second.stamp) {
            it = entries.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    entries.clear();
}

std::size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

} // namespace NodeCraft
