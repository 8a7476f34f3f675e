#pragma once
#include <cstdint>
#include <functional>

namespace archon {

/**
 * @brief Opaque identity of an object stored in a World.
 *
 * @details Identities are handed out by the World in increasing order and are never reused,
 * so a stale handle can never alias a newer entity. The value carries no payload; it is only
 * a key into the World's record map.
 */
struct Entity {
    /** @brief The raw identity value. 0 is reserved for INVALID_ENTITY. */
    uint64_t id = 0;

    bool operator==(const Entity& o) const { return id == o.id; }
    bool operator!=(const Entity& o) const { return id != o.id; }
    bool operator<(const Entity& o) const { return id < o.id; }
};

/**
 * @brief Represents a null or invalid entity handle.
 * @details Never assigned to a live entity. Returned by operations that have no entity to
 * report, e.g. `Archetype::release_slot` when the removed slot was the last one.
 */
inline constexpr Entity INVALID_ENTITY{0};

/**
 * @brief Hasher for using Entity keys in std::unordered_map or std::unordered_set.
 */
struct EntityHash {
    size_t operator()(const Entity& e) const { return std::hash<uint64_t>{}(e.id); }
};

} // namespace archon
