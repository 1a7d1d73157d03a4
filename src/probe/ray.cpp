/**
 * @file ray.cpp
 * @brief Probe ray construction from camera state.
 */

#include <ridgeline/probe/ray.hpp>

namespace ridgeline {
namespace probe {

namespace {

// Column-vector transform: raylib matrices store m0..m15 column-major.
inline Vector4 transform(const Matrix& m, Vector4 v) {
    return {
        m.m0 * v.x + m.m4 * v.y + m.m8 * v.z + m.m12 * v.w,
        m.m1 * v.x + m.m5 * v.y + m.m9 * v.z + m.m13 * v.w,
        m.m2 * v.x + m.m6 * v.y + m.m10 * v.z + m.m14 * v.w,
        m.m3 * v.x + m.m7 * v.y + m.m11 * v.z + m.m15 * v.w
    };
}

inline Vector3 perspective_divide(Vector4 v) {
    return {v.x / v.w, v.y / v.w, v.z / v.w};
}

} // namespace

CameraUniform to_uniform(const CameraState& camera) {
    CameraUniform u;
    u.view_pos = camera.view_pos;
    u.view_proj = MatrixToFloatV(camera.view_proj);
    return u;
}

CameraState camera_state(const Camera3D& camera, float aspect, float near_plane, float far_plane) {
    Matrix view = MatrixLookAt(camera.position, camera.target, camera.up);
    Matrix proj = MatrixPerspective(camera.fovy * DEG2RAD, aspect, near_plane, far_plane);

    CameraState state;
    state.view_pos = {camera.position.x, camera.position.y, camera.position.z, 1.0f};
    // raymath multiplies left-to-right in application order
    state.view_proj = MatrixMultiply(view, proj);
    return state;
}

Ray downward_ray(const CameraState& camera) {
    Ray ray;
    ray.position = {camera.view_pos.x, camera.view_pos.y, camera.view_pos.z};
    ray.direction = {0.0f, -1.0f, 0.0f};
    return ray;
}

Ray pick_ray(const CameraState& camera, Vector2 ndc) {
    Matrix inv = MatrixInvert(camera.view_proj);
    Vector3 near_point = perspective_divide(transform(inv, {ndc.x, ndc.y, -1.0f, 1.0f}));
    Vector3 far_point = perspective_divide(transform(inv, {ndc.x, ndc.y, 1.0f, 1.0f}));

    Ray ray;
    ray.position = near_point;
    ray.direction = Vector3Normalize(Vector3Subtract(far_point, near_point));
    return ray;
}

Vector2 screen_to_ndc(Vector2 screen, float width, float height) {
    return {2.0f * screen.x / width - 1.0f, 1.0f - 2.0f * screen.y / height};
}

} // namespace probe
} // namespace ridgeline
