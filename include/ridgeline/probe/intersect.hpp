#pragma once

/**
 * @file intersect.hpp
 * @brief Ray/triangle intersection (Moller-Trumbore).
 */

#include "raylib.h"

namespace ridgeline {
namespace probe {

/**
 * @brief Distance along the ray to triangle (v0, v1, v2).
 *
 * Returns constants::NO_HIT (-1) when the ray is parallel to the triangle
 * plane or passes outside it. Otherwise returns t, which may be negative
 * when the triangle lies behind the origin; callers keep only t > 0.
 * Barycentric bounds are inclusive, so shared edges hit both triangles.
 */
float intersect_ray_triangle(const Ray& ray, Vector3 v0, Vector3 v1, Vector3 v2);

/**
 * @brief True for a probe result that is an actual hit distance.
 */
bool is_hit(float distance);

} // namespace probe
} // namespace ridgeline
