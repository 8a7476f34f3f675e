#pragma once

/**
 * @file archon.hpp
 * @brief Main entry point for the archon storage engine.
 * @details Includes the core: hashing, entities, columns, archetypes and the World.
 * The GLM bridge (`integration/glm.hpp`) is opt-in and must be included separately.
 */

#include "archetype.hpp"
#include "component.hpp"
#include "entity.hpp"
#include "hash.hpp"
#include "math.hpp"
#include "world.hpp"
