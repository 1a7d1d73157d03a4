#pragma once

/**
 * @file plane_probe.hpp
 * @brief Placeholder ground-plane probe.
 *
 * Not a plane intersector: it only reports camera-relative feedback
 * without touching mesh geometry.
 */

#include <vector>

namespace ridgeline {
namespace probe {

struct CameraState;

enum class PlaneProbeMode {
    CONSTANT,       // Writes PLANE_PROBE_CONSTANT
    CAMERA_HEIGHT   // Writes view_pos.y (distance to y=0 when above it)
};

constexpr float PLANE_PROBE_CONSTANT = 1.0f;

/**
 * @brief Write the probe value to result[0] and return it.
 */
float probe_plane(const CameraState& camera, PlaneProbeMode mode, std::vector<float>& result);

} // namespace probe
} // namespace ridgeline
