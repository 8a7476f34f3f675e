#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace archon {

/**
 * @file hash.hpp
 * @brief Deterministic 64-bit hashing used for component ids and archetype signatures.
 * @details FNV-1a over bytes with the seed folded into the offset basis, followed by a
 * 64-bit avalanche. Results are stable across runs, platforms and builds, so ids derived
 * from names can be persisted by external tooling.
 */

inline constexpr uint64_t FNV_OFFSET = 14695981039346656037ull;
inline constexpr uint64_t FNV_PRIME = 1099511628211ull;

/** @brief splitmix64 finaliser. Maps 0 to 0. */
constexpr uint64_t mix64(uint64_t h) {
    h ^= h >> 30;
    h *= 0xbf58476d1ce4e5b9ull;
    h ^= h >> 27;
    h *= 0x94d049bb133111ebull;
    h ^= h >> 31;
    return h;
}

/**
 * @brief Incremental, order-sensitive hasher.
 * @details Feed bytes or 64-bit words, then call `finish()`. Words are fed as 8 little-endian
 * bytes regardless of host byte order.
 */
class Hasher {
public:
    constexpr explicit Hasher(uint64_t seed = 0) : state_(FNV_OFFSET ^ mix64(seed)) {}

    constexpr void update(unsigned char byte) {
        state_ ^= byte;
        state_ *= FNV_PRIME;
    }

    constexpr void update(std::string_view bytes) {
        for (char c : bytes)
            update(static_cast<unsigned char>(c));
    }

    constexpr void update_u64(uint64_t word) {
        for (int i = 0; i < 8; ++i)
            update(static_cast<unsigned char>(word >> (i * 8)));
    }

    constexpr uint64_t finish() const { return mix64(state_); }

private:
    uint64_t state_;
};

/** @brief One-shot hash of a byte string. */
constexpr uint64_t hash_bytes(std::string_view bytes, uint64_t seed = 0) {
    Hasher h(seed);
    h.update(bytes);
    return h.finish();
}

/** @brief One-shot hash of a sequence of 64-bit words, in the given order. */
inline uint64_t hash_words(const uint64_t* words, size_t n, uint64_t seed = 0) {
    Hasher h(seed);
    for (size_t i = 0; i < n; ++i)
        h.update_u64(words[i]);
    return h.finish();
}

} // namespace archon
