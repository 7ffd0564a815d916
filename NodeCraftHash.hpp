// NodeCraft hashing helpers
//
// FNV-1a, deterministic across runs. Version stamps and proto node
// identities are built from these.
#pragma once
#include <cstdint>
#include <cstring>
#include <string>

namespace NodeCraft {

inline constexpr std::uint64_t kHashSeed = 0xcbf29ce484222325ull;

inline std::uint64_t hashBytes(const void* data, std::size_t size, std::uint64_t h = kHashSeed) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        h ^= bytes[i];
        h *= 0x100000001b3ull;
    }
    return h;
}

inline std::uint64_t hashString(const std::string& s, std::uint64_t h = kHashSeed) {
    h = hashBytes(s.data(), s.size(), h);
    // terminator so ("ab","c") and ("a","bc") differ
    const unsigned char end = 0xff;
    return hashBytes(&end, 1, h);
}

inline std::uint64_t hashU64(std::uint64_t v, std::uint64_t h = kHashSeed) {
    return hashBytes(&v, sizeof(v), h);
}

inline std::uint64_t hashDouble(double v, std::uint64_t h = kHashSeed) {
    if (v == 0.0) v = 0.0; // -0.0 and 0.0 compare equal
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return hashU64(bits, h);
}

inline std::uint64_t hashCombine(std::uint64_t h, std::uint64_t v) { return hashU64(v, h); }

} // namespace NodeCraft
