#pragma once

#include <cstdint>
#include <initializer_list>

namespace core {

inline uint64_t splitmix64(uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

// Folds each component through splitmix64 so that distinct component
// tuples map to well-separated stream seeds.
inline uint64_t derive_seed(uint64_t base, std::initializer_list<uint64_t> components) noexcept {
    uint64_t h = splitmix64(base);
    for (uint64_t c : components) {
        h = splitmix64(h ^ splitmix64(c + 0x632BE59BD9B4E019ULL));
    }
    return h;
}

} // namespace core
