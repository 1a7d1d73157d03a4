#pragma once

/**
 * @file noise.hpp
 * @brief 2D simplex noise and fractal Brownian motion.
 *
 * Both functions are pure and deterministic. The GLSL copy in the terrain
 * compute shader follows the same arithmetic step for step.
 */

#include "raylib.h"

namespace ridgeline {
namespace terrain {

/**
 * @brief 2D simplex gradient noise, roughly in [-1, 1].
 *
 * Skewed triangle lattice, polynomial permutation hash over a 289 period,
 * (0.5 - r^2)^4 falloff per corner.
 */
float snoise2(Vector2 v);

/**
 * @brief Five octaves of rotated, doubled, halved snoise2.
 *
 * Input is pre-scaled by 0.01. Output is about [-1, 1] but is not clamped;
 * callers must tolerate small overshoot.
 */
float fbm(Vector2 p);

} // namespace terrain
} // namespace ridgeline
