/**
 * @file noise.cpp
 * @brief Simplex noise (Gustavson/McEwan layout) and fbm.
 */

#include <ridgeline/terrain/noise.hpp>
#include <ridgeline/core/constants.hpp>

#include <algorithm>
#include <cmath>

namespace ridgeline {
namespace terrain {

namespace {

// Skew/unskew factors: (3-sqrt(3))/6, (sqrt(3)-1)/2, -1+2*C0, 1/41
constexpr float C0 = 0.211324865405187f;
constexpr float C1 = 0.366025403784439f;
constexpr float C2 = -0.577350269189626f;
constexpr float C3 = 0.024390243902439f;

// GLSL mod: result takes the sign of the divisor
inline float mod289(float x) {
    return x - constants::NOISE_PERIOD * std::floor(x / constants::NOISE_PERIOD);
}

inline float permute(float x) { return mod289((x * 34.0f + 1.0f) * x); }

inline float fract(float x) { return x - std::floor(x); }

} // namespace

float snoise2(Vector2 v) {
    // First corner
    float skew = (v.x + v.y) * C1;
    float ix = std::floor(v.x + skew);
    float iy = std::floor(v.y + skew);
    float unskew = (ix + iy) * C0;
    float x0x = v.x - ix + unskew;
    float x0y = v.y - iy + unskew;

    // Other corners
    float i1x = (x0x > x0y) ? 1.0f : 0.0f;
    float i1y = (x0x > x0y) ? 0.0f : 1.0f;
    float x1x = x0x + C0 - i1x;
    float x1y = x0y + C0 - i1y;
    float x2x = x0x + C2;
    float x2y = x0y + C2;

    // Permutations
    ix = mod289(ix);
    iy = mod289(iy);
    float p0 = permute(permute(iy) + ix);
    float p1 = permute(permute(iy + i1y) + ix + i1x);
    float p2 = permute(permute(iy + 1.0f) + ix + 1.0f);

    float m0 = std::max(0.5f - (x0x * x0x + x0y * x0y), 0.0f);
    float m1 = std::max(0.5f - (x1x * x1x + x1y * x1y), 0.0f);
    float m2 = std::max(0.5f - (x2x * x2x + x2y * x2y), 0.0f);
    m0 *= m0; m0 *= m0;
    m1 *= m1; m1 *= m1;
    m2 *= m2; m2 *= m2;

    // Gradients: 41 points uniformly over a line, mapped onto a diamond
    float gx0 = 2.0f * fract(p0 * C3) - 1.0f;
    float gx1 = 2.0f * fract(p1 * C3) - 1.0f;
    float gx2 = 2.0f * fract(p2 * C3) - 1.0f;
    float h0 = std::fabs(gx0) - 0.5f;
    float h1 = std::fabs(gx1) - 0.5f;
    float h2 = std::fabs(gx2) - 0.5f;
    float a0 = gx0 - std::floor(gx0 + 0.5f);
    float a1 = gx1 - std::floor(gx1 + 0.5f);
    float a2 = gx2 - std::floor(gx2 + 0.5f);

    // Normalise gradients implicitly by scaling m
    m0 *= 1.79284291400159f - 0.85373472095314f * (a0 * a0 + h0 * h0);
    m1 *= 1.79284291400159f - 0.85373472095314f * (a1 * a1 + h1 * h1);
    m2 *= 1.79284291400159f - 0.85373472095314f * (a2 * a2 + h2 * h2);

    float g0 = a0 * x0x + h0 * x0y;
    float g1 = a1 * x1x + h1 * x1y;
    float g2 = a2 * x2x + h2 * x2y;
    return 130.0f * (m0 * g0 + m1 * g1 + m2 * g2);
}

float fbm(Vector2 p) {
    float x = p.x * constants::FBM_INPUT_SCALE;
    float y = p.y * constants::FBM_INPUT_SCALE;
    float v = 0.0f;
    float a = constants::FBM_AMPLITUDE;

    const float c = std::cos(constants::FBM_ROTATION);
    const float s = std::sin(constants::FBM_ROTATION);

    for (int i = 0; i < constants::NUM_OCTAVES; ++i) {
        v += a * snoise2({x, y});
        float rx = c * x - s * y;
        float ry = s * x + c * y;
        x = rx * 2.0f + constants::FBM_SHIFT;
        y = ry * 2.0f + constants::FBM_SHIFT;
        a *= 0.5f;
    }
    return v;
}

} // namespace terrain
} // namespace ridgeline
