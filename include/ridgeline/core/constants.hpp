#pragma once

/**
 * @file constants.hpp
 * @brief Kernel constants shared by the CPU and GPU terrain/probe paths.
 *
 * The GLSL sources in src/gpu mirror these values literally; keep them in
 * sync when changing either side.
 */

#include <cstdint>

namespace ridgeline {
namespace constants {

// === Noise / fbm ===
constexpr int NUM_OCTAVES = 5;
constexpr float FBM_INPUT_SCALE = 0.01f;   // World units -> noise space
constexpr float FBM_ROTATION = 0.5f;       // Radians per octave
constexpr float FBM_SHIFT = 100.0f;        // Per-octave offset (both axes)
constexpr float FBM_AMPLITUDE = 0.5f;      // First octave amplitude
constexpr float NOISE_PERIOD = 289.0f;     // Permutation polynomial period

// === Height sampling ===
constexpr float NORMAL_EPSILON = 0.1f;     // Finite difference offset

// === Intersection ===
constexpr float PARALLEL_EPSILON = 1e-5f;  // |det| below this = parallel
constexpr float NO_HIT = -1.0f;            // Ray/triangle miss
constexpr float MISS_DISTANCE = 1e38f;     // Probe result when nothing hit

// === Mesh layout ===
constexpr uint32_t INDICES_PER_CELL = 6;
constexpr uint32_t LEGACY_SCAN_BOUND = 6144; // 1024 cells = one 32x32 chunk

// === Dispatch shapes ===
constexpr uint32_t MESH_WORKGROUP_SIZE = 64;
constexpr uint32_t PROBE_WORKGROUP_SIZE = 1;

}  // namespace constants
}  // namespace ridgeline
