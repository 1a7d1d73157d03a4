/**
 * @file mesh_builder.cpp
 * @brief Parallel heightfield-to-triangle-list builder.
 */

#include <ridgeline/terrain/mesh_builder.hpp>
#include <ridgeline/terrain/height_sampler.hpp>
#include <ridgeline/core/constants.hpp>

namespace ridgeline {
namespace terrain {

void build_invocation(uint32_t i, const ChunkDescriptor& desc,
                      Vertex* vertices, uint32_t* indices) {
    const uint32_t row = desc.size_x + 1;
    const uint32_t num_vertices = row * (desc.size_y + 1);
    if (i >= num_vertices) return;

    // Lattice position -> world position
    Vector2 p = {
        static_cast<float>(static_cast<int32_t>(i % row) + desc.corner_x),
        static_cast<float>(static_cast<int32_t>(i / row) + desc.corner_y)
    };
    vertices[i] = terrain_vertex(p, desc.min_max_height);

    // Quad cell i; the lattice is one wider than the cell grid, hence the
    // row-skip correction.
    if (i < desc.size_x * desc.size_y) {
        const uint32_t start = i * constants::INDICES_PER_CELL;
        const uint32_t v00 = i + i / desc.size_x;
        const uint32_t v10 = v00 + 1;
        const uint32_t v01 = v00 + row;
        const uint32_t v11 = v01 + 1;

        indices[start + 0] = v00;
        indices[start + 1] = v01;
        indices[start + 2] = v11;
        indices[start + 3] = v00;
        indices[start + 4] = v11;
        indices[start + 5] = v10;
    }
}

void build_chunk(const ChunkDescriptor& desc, ChunkMesh& mesh) {
    mesh.desc = desc;
    mesh.vertices.resize(vertex_count(desc));
    mesh.indices.resize(index_count(desc));

    Vertex* vertices = mesh.vertices.data();
    uint32_t* indices = mesh.indices.data();
    const int n = static_cast<int>(mesh.vertices.size());

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; ++i) {
        build_invocation(static_cast<uint32_t>(i), desc, vertices, indices);
    }
}

void build_chunk_serial(const ChunkDescriptor& desc, ChunkMesh& mesh) {
    mesh.desc = desc;
    mesh.vertices.resize(vertex_count(desc));
    mesh.indices.resize(index_count(desc));

    const uint32_t n = static_cast<uint32_t>(mesh.vertices.size());
    for (uint32_t i = 0; i < n; ++i) {
        build_invocation(i, desc, mesh.vertices.data(), mesh.indices.data());
    }
}

uint32_t dispatch_groups(const ChunkDescriptor& desc) {
    const uint32_t n = static_cast<uint32_t>(vertex_count(desc));
    return (n + constants::MESH_WORKGROUP_SIZE - 1) / constants::MESH_WORKGROUP_SIZE;
}

} // namespace terrain
} // namespace ridgeline
