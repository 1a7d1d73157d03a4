/**
 * @file mesh_probe.cpp
 * @brief Brute-force closest-hit scan over a chunk index buffer.
 */

#include <ridgeline/probe/mesh_probe.hpp>
#include <ridgeline/probe/intersect.hpp>

#include <algorithm>
#include <omp.h>

namespace ridgeline {
namespace probe {

namespace {

inline void ensure_slot(ResultBuffer& result) {
    if (result.empty()) result.resize(1);
}

} // namespace

uint32_t scan_limit(uint32_t scan_bound, size_t index_count) {
    size_t limit = index_count;
    if (scan_bound != SCAN_ALL) {
        limit = std::min<size_t>(scan_bound, index_count);
    }
    limit -= limit % constants::INDICES_PER_CELL;
    return static_cast<uint32_t>(limit);
}

float probe_cell(const Ray& ray, const terrain::Vertex* vertices, size_t vertex_count,
                 const uint32_t* indices, uint32_t start) {
    const uint32_t i00 = indices[start + 0];
    const uint32_t i01 = indices[start + 1];
    const uint32_t i11 = indices[start + 2];
    const uint32_t i10 = indices[start + 5];
    if (i00 >= vertex_count || i01 >= vertex_count ||
        i11 >= vertex_count || i10 >= vertex_count) {
        return constants::MISS_DISTANCE;
    }

    const Vector3 v00 = vertices[i00].position;
    const Vector3 v01 = vertices[i01].position;
    const Vector3 v11 = vertices[i11].position;
    const Vector3 v10 = vertices[i10].position;

    float best = constants::MISS_DISTANCE;
    float t1 = intersect_ray_triangle(ray, v00, v01, v11);
    if (t1 > 0.0f && t1 < best) best = t1;
    float t2 = intersect_ray_triangle(ray, v00, v11, v10);
    if (t2 > 0.0f && t2 < best) best = t2;
    return best;
}

float probe_mesh(const Ray& ray,
                 const std::vector<terrain::Vertex>& vertices,
                 const std::vector<uint32_t>& indices,
                 uint32_t scan_bound,
                 ResultBuffer& result) {
    const uint32_t limit = scan_limit(scan_bound, indices.size());

    float closest = constants::MISS_DISTANCE;
    for (uint32_t i = 0; i < limit; i += constants::INDICES_PER_CELL) {
        closest = std::min(closest, probe_cell(ray, vertices.data(), vertices.size(),
                                               indices.data(), i));
    }

    ensure_slot(result);
    result[0] = closest;
    return closest;
}

float probe_mesh_parallel(const Ray& ray,
                          const std::vector<terrain::Vertex>& vertices,
                          const std::vector<uint32_t>& indices,
                          uint32_t scan_bound,
                          ResultBuffer& result) {
    const uint32_t limit = scan_limit(scan_bound, indices.size());
    const int num_cells = static_cast<int>(limit / constants::INDICES_PER_CELL);

    // Pass 1: partial minima, one slot per thread
    std::vector<float> partials(static_cast<size_t>(omp_get_max_threads()),
                                constants::MISS_DISTANCE);
    const terrain::Vertex* vtx = vertices.data();
    const size_t vtx_count = vertices.size();
    const uint32_t* idx = indices.data();

#pragma omp parallel
    {
        float local = constants::MISS_DISTANCE;
#pragma omp for schedule(static)
        for (int c = 0; c < num_cells; ++c) {
            uint32_t start = static_cast<uint32_t>(c) * constants::INDICES_PER_CELL;
            local = std::min(local, probe_cell(ray, vtx, vtx_count, idx, start));
        }
        partials[static_cast<size_t>(omp_get_thread_num())] = local;
    }

    // Pass 2: combine
    float closest = constants::MISS_DISTANCE;
    for (float p : partials) {
        closest = std::min(closest, p);
    }

    ensure_slot(result);
    result[0] = closest;
    return closest;
}

float probe_mesh(const Ray& ray, const terrain::ChunkMesh& mesh,
                 const ProbeConfig& config, ResultBuffer& result) {
    return probe_mesh(ray, mesh.vertices, mesh.indices, config.scan_bound, result);
}

float probe_mesh_parallel(const Ray& ray, const terrain::ChunkMesh& mesh,
                          const ProbeConfig& config, ResultBuffer& result) {
    return probe_mesh_parallel(ray, mesh.vertices, mesh.indices, config.scan_bound, result);
}

} // namespace probe
} // namespace ridgeline
