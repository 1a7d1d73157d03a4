#pragma once

/**
 * @file ray.hpp
 * @brief Camera state and probe ray construction.
 *
 * Rays use raylib's Ray (position = origin, direction).
 */

#include "raylib.h"
#include "raymath.h"

namespace ridgeline {
namespace probe {

/**
 * @brief Camera record supplied by the renderer each frame.
 */
struct CameraState {
    Vector4 view_pos = {0.0f, 0.0f, 0.0f, 1.0f};
    Matrix view_proj = MatrixIdentity();
};

/**
 * @brief std140 upload form of CameraState (matrix column-major).
 */
struct CameraUniform {
    Vector4 view_pos;
    float16 view_proj;
};

static_assert(sizeof(CameraUniform) == 80, "CameraUniform must match the uniform block");

CameraUniform to_uniform(const CameraState& camera);

/**
 * @brief Build camera state from a raylib 3D camera and viewport aspect.
 */
CameraState camera_state(const Camera3D& camera, float aspect, float near_plane, float far_plane);

/**
 * @brief Straight-down ray from the camera position.
 */
Ray downward_ray(const CameraState& camera);

/**
 * @brief Camera-to-cursor ray through an NDC point.
 *
 * Unprojects the point at the near and far clip planes through
 * inverse(view_proj); direction is normalized. Origin sits on the near plane.
 */
Ray pick_ray(const CameraState& camera, Vector2 ndc);

/**
 * @brief Screen pixel to NDC (+y up).
 */
Vector2 screen_to_ndc(Vector2 screen, float width, float height);

/**
 * @brief Point at distance t along the ray.
 */
inline Vector3 ray_at(const Ray& ray, float t) {
    return Vector3Add(ray.position, Vector3Scale(ray.direction, t));
}

} // namespace probe
} // namespace ridgeline
