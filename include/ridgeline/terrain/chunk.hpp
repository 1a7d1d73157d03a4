#pragma once

/**
 * @file chunk.hpp
 * @brief Chunk descriptor and mesh records shared with the compute kernels.
 *
 * Layouts here are uploaded verbatim: ChunkDescriptor matches the std140
 * uniform block, Vertex matches the std430 {vec3 position; vec3 normal;}
 * element (vec3 aligned to 16 bytes, 32 byte stride).
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "raylib.h"

namespace ridgeline {
namespace terrain {

/**
 * @brief Rectangular vertex grid to generate and its height range.
 *
 * Lattice x runs along world X, lattice y along world Z.
 */
struct ChunkDescriptor {
    uint32_t size_x = 32;       // Quad cells along X
    uint32_t size_y = 32;       // Quad cells along Z
    int32_t corner_x = 0;       // World-space lattice corner
    int32_t corner_y = 0;
    Vector2 min_max_height = {-5.0f, 5.0f};
};

static_assert(sizeof(ChunkDescriptor) == 24, "ChunkDescriptor must match the uniform block");

/**
 * @brief One lattice vertex. Padding keeps the GPU stride at 32 bytes.
 */
struct Vertex {
    Vector3 position;
    float pad0;
    Vector3 normal;
    float pad1;
};

static_assert(sizeof(Vertex) == 32, "Vertex must match the std430 stride");

/**
 * @brief Host copy of a generated chunk.
 */
struct ChunkMesh {
    ChunkDescriptor desc;
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
};

/**
 * @brief Terrain generation settings.
 */
struct TerrainConfig {
    uint32_t chunk_size_x = 32;
    uint32_t chunk_size_y = 32;
    Vector2 min_max_height = {-5.0f, 5.0f};
    bool use_gpu = true;       // Falls back to the CPU path if shaders fail
};

// (size_x+1) * (size_y+1)
inline size_t vertex_count(const ChunkDescriptor& desc) {
    return static_cast<size_t>(desc.size_x + 1) * (desc.size_y + 1);
}

// 6 per quad cell
inline size_t index_count(const ChunkDescriptor& desc) {
    return static_cast<size_t>(desc.size_x) * desc.size_y * 6;
}

/**
 * @brief Descriptor for the chunk whose lattice corner is (corner_x, corner_y).
 */
ChunkDescriptor make_descriptor(const TerrainConfig& config, int32_t corner_x, int32_t corner_y);

/**
 * @brief Corner of the chunk containing world position (x, z).
 *
 * Floor division, so negative positions land in the chunk below/left.
 */
void chunk_corner_for(float world_x, float world_z, uint32_t size_x, uint32_t size_y,
                      int32_t& corner_x, int32_t& corner_y);

/**
 * @brief Map key for a chunk corner, "x_z".
 */
std::string chunk_key(int32_t corner_x, int32_t corner_y);

/**
 * @brief True if world (x, z) lies inside the chunk footprint.
 */
bool chunk_contains(const ChunkDescriptor& desc, float world_x, float world_z);

} // namespace terrain
} // namespace ridgeline
