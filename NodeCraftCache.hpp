// NodeCraft result cache
//
// Memoized node outputs keyed by proto node identity. An entry is only valid
// for the stamp it was computed under; a lookup with any other stamp misses.
#pragma once
#include "NodeCraftProtoGraph.hpp"
#include "NodeCraftTypes.hpp"
#include "NodeCraftValue.hpp"
#include <mutex>
#include <optional>
#include <unordered_map>

namespace NodeCraft {

class ResultCache {
public:
    std::optional<Value> lookup(ProtoNodeId id, Stamp stamp) const;
    void store(ProtoNodeId id, Stamp stamp, Value value);
    bool contains(ProtoNodeId id, Stamp stamp) const;

    // Drops every entry whose identity is gone from `graph` or whose stamp
    // changed. Returns the number of evicted entries.
    std::size_t retain(const ProtoGraph& graph);

    void clear();
    std::size_t size() const;

private:
    struct Entry {
        Stamp stamp = 0;
        Value value;
    };

    mutable std::mutex mutex;
    std::unordered_map<ProtoNodeId, Entry> entries;
};

} // namespace NodeCraft
