#pragma once

/**
 * @file mesh_builder.hpp
 * @brief CPU reference of the terrain mesh compute kernel.
 *
 * build_invocation() is the body of one kernel invocation; build_chunk()
 * dispatches all of them with OpenMP. Invocation i owns vertices[i] and
 * indices[6i, 6i+6), so invocations never write the same slot and never
 * read each other's output.
 */

#include <cstdint>
#include <vector>

#include <ridgeline/terrain/chunk.hpp>

namespace ridgeline {
namespace terrain {

/**
 * @brief Run kernel invocation i against caller-sized buffers.
 *
 * vertices must hold vertex_count(desc) records and indices
 * index_count(desc) entries. Invocations past the last vertex return
 * without writing, mirroring the over-dispatched tail of a GPU group.
 */
void build_invocation(uint32_t i, const ChunkDescriptor& desc,
                      Vertex* vertices, uint32_t* indices);

/**
 * @brief Generate every vertex and index of a chunk.
 *
 * Resizes mesh buffers to the descriptor's counts first; previous contents
 * are overwritten, not appended to.
 */
void build_chunk(const ChunkDescriptor& desc, ChunkMesh& mesh);

/**
 * @brief Same as build_chunk() on a single thread (benchmark baseline).
 */
void build_chunk_serial(const ChunkDescriptor& desc, ChunkMesh& mesh);

/**
 * @brief Workgroups needed to cover every vertex (group size 64).
 */
uint32_t dispatch_groups(const ChunkDescriptor& desc);

} // namespace terrain
} // namespace ridgeline
