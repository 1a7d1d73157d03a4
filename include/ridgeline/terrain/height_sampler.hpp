#pragma once

/**
 * @file height_sampler.hpp
 * @brief Terrain surface points and finite-difference normals from fbm.
 */

#include <ridgeline/terrain/chunk.hpp>

#include "raylib.h"

namespace ridgeline {
namespace terrain {

/**
 * @brief Surface point above lattice position p: (p.x, lerp(min, max, fbm(p)), p.y).
 *
 * fbm is used as the blend factor as-is (no clamping), so heights can
 * leave [min, max] slightly.
 */
Vector3 terrain_point(Vector2 p, Vector2 min_max_height);

/**
 * @brief Vertex at p with a central-difference normal.
 *
 * Samples +-0.1 along both axes, normalizes the cross product of the
 * positive pair and of the negative pair, and stores their average. The
 * average is not renormalized.
 */
Vertex terrain_vertex(Vector2 p, Vector2 min_max_height);

} // namespace terrain
} // namespace ridgeline
