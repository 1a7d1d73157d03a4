/**
 * @file intersect.cpp
 * @brief Moller-Trumbore ray/triangle test.
 */

#include <ridgeline/probe/intersect.hpp>
#include <ridgeline/core/constants.hpp>

#include <cmath>

#include "raymath.h"

namespace ridgeline {
namespace probe {

float intersect_ray_triangle(const Ray& ray, Vector3 v0, Vector3 v1, Vector3 v2) {
    Vector3 e1 = Vector3Subtract(v1, v0);
    Vector3 e2 = Vector3Subtract(v2, v0);
    Vector3 h = Vector3CrossProduct(ray.direction, e2);
    float a = Vector3DotProduct(e1, h);

    if (std::fabs(a) < constants::PARALLEL_EPSILON) {
        return constants::NO_HIT;
    }

    float f = 1.0f / a;
    Vector3 s = Vector3Subtract(ray.position, v0);
    float u = f * Vector3DotProduct(s, h);
    if (u < 0.0f || u > 1.0f) {
        return constants::NO_HIT;
    }

    Vector3 q = Vector3CrossProduct(s, e1);
    float v = f * Vector3DotProduct(ray.direction, q);
    if (v < 0.0f || u + v > 1.0f) {
        return constants::NO_HIT;
    }

    return f * Vector3DotProduct(e2, q);
}

bool is_hit(float distance) {
    return distance > 0.0f && distance < constants::MISS_DISTANCE;
}

} // namespace probe
} // namespace ridgeline
