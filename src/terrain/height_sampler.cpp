/**
 * @file height_sampler.cpp
 * @brief fbm heightfield sampling.
 */

#include <ridgeline/terrain/height_sampler.hpp>
#include <ridgeline/terrain/noise.hpp>
#include <ridgeline/core/constants.hpp>

#include <cmath>

#include "raymath.h"

namespace ridgeline {
namespace terrain {

namespace {

// Divides by the length rather than multiplying by its reciprocal so that
// axis-aligned inputs come out exactly unit length.
inline Vector3 normalize(Vector3 v) {
    float len = std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
    if (len == 0.0f) return v;
    return {v.x / len, v.y / len, v.z / len};
}

} // namespace

Vector3 terrain_point(Vector2 p, Vector2 min_max_height) {
    return {p.x, Lerp(min_max_height.x, min_max_height.y, fbm(p)), p.y};
}

Vertex terrain_vertex(Vector2 p, Vector2 min_max_height) {
    const float e = constants::NORMAL_EPSILON;
    Vector3 v = terrain_point(p, min_max_height);

    Vector3 tpx = Vector3Subtract(terrain_point({p.x + e, p.y}, min_max_height), v);
    Vector3 tpz = Vector3Subtract(terrain_point({p.x, p.y + e}, min_max_height), v);
    Vector3 tnx = Vector3Subtract(terrain_point({p.x - e, p.y}, min_max_height), v);
    Vector3 tnz = Vector3Subtract(terrain_point({p.x, p.y - e}, min_max_height), v);

    Vector3 pn = normalize(Vector3CrossProduct(tpz, tpx));
    Vector3 nn = normalize(Vector3CrossProduct(tnz, tnx));
    Vector3 n = Vector3Scale(Vector3Add(pn, nn), 0.5f);

    Vertex out{};
    out.position = v;
    out.normal = n;
    return out;
}

} // namespace terrain
} // namespace ridgeline
