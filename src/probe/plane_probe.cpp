/**
 * @file plane_probe.cpp
 * @brief Placeholder ground-plane probe.
 */

#include <ridgeline/probe/plane_probe.hpp>
#include <ridgeline/probe/ray.hpp>

namespace ridgeline {
namespace probe {

float probe_plane(const CameraState& camera, PlaneProbeMode mode, std::vector<float>& result) {
    float value = PLANE_PROBE_CONSTANT;
    if (mode == PlaneProbeMode::CAMERA_HEIGHT) {
        value = camera.view_pos.y;
    }

    if (result.empty()) result.resize(1);
    result[0] = value;
    return value;
}

} // namespace probe
} // namespace ridgeline
