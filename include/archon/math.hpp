#pragma once

namespace archon {

/**
 * @brief Standard packed float3 layout.
 * @details Matches GLM, Raylib, Unity, Unreal, etc.
 * Designed to be binary-compatible with common math libraries, so columns of Vec3 can be
 * handed to them without conversion.
 */
struct Vec3 {
    /** @brief X component. */
    float x;
    /** @brief Y component. */
    float y;
    /** @brief Z component. */
    float z;
};

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3& a, const Vec3& b) { return !(a == b); }

} // namespace archon
