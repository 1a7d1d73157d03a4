#pragma once

/**
 * @file mesh_probe.hpp
 * @brief Closest-hit scan of a terrain triangle list (CPU reference).
 *
 * The scan walks the index buffer one quad cell (6 indices, 2 triangles)
 * at a time and keeps the smallest positive hit distance. Slot 0 of the
 * result buffer receives that distance, or constants::MISS_DISTANCE when
 * nothing was hit.
 *
 * By default only the first LEGACY_SCAN_BOUND indices (1024 cells) are
 * scanned, as the original kernel did; larger chunks are silently
 * truncated. Pass SCAN_ALL to scan the whole buffer instead.
 */

#include <cstdint>
#include <vector>

#include <ridgeline/core/constants.hpp>
#include <ridgeline/probe/plane_probe.hpp>
#include <ridgeline/terrain/chunk.hpp>

#include "raylib.h"

namespace ridgeline {
namespace probe {

// scan_bound value meaning "the full index buffer"
constexpr uint32_t SCAN_ALL = 0;

using ResultBuffer = std::vector<float>;

/**
 * @brief Probe settings.
 */
struct ProbeConfig {
    uint32_t scan_bound = constants::LEGACY_SCAN_BOUND;
    PlaneProbeMode plane_mode = PlaneProbeMode::CAMERA_HEIGHT;
};

/**
 * @brief Number of indices a scan visits: min(bound, count), whole cells only.
 */
uint32_t scan_limit(uint32_t scan_bound, size_t index_count);

/**
 * @brief Closest positive hit among the two triangles of the cell at
 *        indices[start, start+6), or MISS_DISTANCE.
 *
 * A cell referencing a vertex past vertex_count contributes nothing.
 */
float probe_cell(const Ray& ray, const terrain::Vertex* vertices, size_t vertex_count,
                 const uint32_t* indices, uint32_t start);

/**
 * @brief Single-invocation scan. Writes and returns result[0].
 */
float probe_mesh(const Ray& ray,
                 const std::vector<terrain::Vertex>& vertices,
                 const std::vector<uint32_t>& indices,
                 uint32_t scan_bound,
                 ResultBuffer& result);

/**
 * @brief Parallel reduction with the same result as probe_mesh().
 *
 * Each OpenMP thread reduces a contiguous run of cells to a partial
 * minimum; a second pass combines the partials.
 */
float probe_mesh_parallel(const Ray& ray,
                          const std::vector<terrain::Vertex>& vertices,
                          const std::vector<uint32_t>& indices,
                          uint32_t scan_bound,
                          ResultBuffer& result);

// Convenience overloads on a host chunk copy
float probe_mesh(const Ray& ray, const terrain::ChunkMesh& mesh,
                 const ProbeConfig& config, ResultBuffer& result);
float probe_mesh_parallel(const Ray& ray, const terrain::ChunkMesh& mesh,
                          const ProbeConfig& config, ResultBuffer& result);

} // namespace probe
} // namespace ridgeline
