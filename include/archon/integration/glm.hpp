#pragma once

#include "../archetype.hpp"
#include "../math.hpp"
#include <glm/glm.hpp>
#include <cstddef>

/**
 * @file glm.hpp
 * @brief GLM Integration Bridge.
 * @details Zero-cost views between archon's packed POD math types and GLM, for both single
 * values and whole archetype columns.
 */

// Layout Verification (Compile-time checks)
static_assert(sizeof(archon::Vec3) == sizeof(glm::vec3), "archon::Vec3 size mismatch");
static_assert(alignof(archon::Vec3) == alignof(glm::vec3), "archon::Vec3 alignment mismatch");

namespace archon {

// --- Zero-Overhead Casting ---

inline const glm::vec3& to_glm(const Vec3& v) { return reinterpret_cast<const glm::vec3&>(v); }
inline glm::vec3& to_glm(Vec3& v) { return reinterpret_cast<glm::vec3&>(v); }

inline Vec3 from_glm(const glm::vec3& v) { return Vec3{v.x, v.y, v.z}; }

/**
 * @brief Views a Vec3 column as a contiguous glm::vec3 array.
 * @return nullptr if the archetype has no such column. Invalidated by the next
 * reserve_slot/release_slot on the archetype.
 */
inline glm::vec3* column_as_glm(Archetype& arch, ComponentId id) {
    Vec3* data = arch.column_data<Vec3>(id);
    return reinterpret_cast<glm::vec3*>(data);
}

/** @brief Adds `delta[i] * scale` to `values[i]` for every row of an archetype. */
inline void integrate(Archetype& arch, ComponentId values, ComponentId delta, float scale) {
    glm::vec3* v = column_as_glm(arch, values);
    glm::vec3* d = column_as_glm(arch, delta);
    if (!v || !d)
        return;
    size_t n = arch.count();
    for (size_t i = 0; i < n; ++i)
        v[i] += d[i] * scale;
}

} // namespace archon
