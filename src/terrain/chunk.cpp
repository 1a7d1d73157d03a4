/**
 * @file chunk.cpp
 * @brief Chunk descriptor helpers.
 */

#include <ridgeline/terrain/chunk.hpp>

#include <cmath>

namespace ridgeline {
namespace terrain {

ChunkDescriptor make_descriptor(const TerrainConfig& config, int32_t corner_x, int32_t corner_y) {
    ChunkDescriptor desc;
    desc.size_x = config.chunk_size_x;
    desc.size_y = config.chunk_size_y;
    desc.corner_x = corner_x;
    desc.corner_y = corner_y;
    desc.min_max_height = config.min_max_height;
    return desc;
}

void chunk_corner_for(float world_x, float world_z, uint32_t size_x, uint32_t size_y,
                      int32_t& corner_x, int32_t& corner_y) {
    float sx = static_cast<float>(size_x);
    float sy = static_cast<float>(size_y);
    corner_x = static_cast<int32_t>(std::floor(world_x / sx)) * static_cast<int32_t>(size_x);
    corner_y = static_cast<int32_t>(std::floor(world_z / sy)) * static_cast<int32_t>(size_y);
}

std::string chunk_key(int32_t corner_x, int32_t corner_y) {
    return std::to_string(corner_x) + "_" + std::to_string(corner_y);
}

bool chunk_contains(const ChunkDescriptor& desc, float world_x, float world_z) {
    float x0 = static_cast<float>(desc.corner_x);
    float z0 = static_cast<float>(desc.corner_y);
    return world_x >= x0 && world_x <= x0 + static_cast<float>(desc.size_x) &&
           world_z >= z0 && world_z <= z0 + static_cast<float>(desc.size_y);
}

} // namespace terrain
} // namespace ridgeline
