#pragma once

/**
 * @file gpu_compute.hpp
 * @brief OpenGL compute shader kernels for terrain meshing and ray probes.
 *
 * Uses raylib's GL 4.3 context (rlgl + bundled glad). Every kernel here has
 * a CPU twin in ridgeline::terrain / ridgeline::probe with the same
 * semantics; callers fall back to those when init() fails.
 */

#include "raylib.h"
#include "rlgl.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <ridgeline/probe/mesh_probe.hpp>
#include <ridgeline/probe/plane_probe.hpp>
#include <ridgeline/probe/ray.hpp>
#include <ridgeline/terrain/chunk.hpp>

namespace ridgeline {
namespace gpu {

/**
 * @brief Which GL binding target a buffer lives on.
 */
enum class BufferKind { STORAGE, UNIFORM };

/**
 * @brief GPU buffer handle for compute shaders.
 */
struct GPUBuffer {
    unsigned int id = 0;
    size_t size = 0;
    BufferKind kind = BufferKind::STORAGE;

    void create(size_t bytes, BufferKind buffer_kind = BufferKind::STORAGE);
    void upload(const void* data, size_t bytes);
    bool download(void* data, size_t bytes);
    void destroy();
};

/**
 * @brief Compute shader wrapper.
 */
class ComputeShader {
public:
    ComputeShader() = default;
    ~ComputeShader();

    ComputeShader(const ComputeShader&) = delete;
    ComputeShader& operator=(const ComputeShader&) = delete;

    /**
     * @brief Compile and link from source. Logs the GL info log on failure.
     */
    bool load(const std::string& source);

    /**
     * @brief Dispatch compute shader.
     * @param groups_x Number of work groups in X
     * @param groups_y Number of work groups in Y
     * @param groups_z Number of work groups in Z
     */
    void dispatch(int groups_x, int groups_y, int groups_z);

    void set_uniform(const char* name, float value);
    void set_uniform(const char* name, int value);
    void set_uniform(const char* name, unsigned int value);
    void set_uniform(const char* name, Vector3 value);

    /**
     * @brief Bind a storage buffer to an SSBO binding point.
     */
    void bind_buffer(int binding, GPUBuffer& buffer);

    /**
     * @brief Bind a uniform buffer to a uniform block binding point.
     */
    void bind_uniform_block(int binding, GPUBuffer& buffer);

    /**
     * @brief Make shader writes visible to later dispatches and readback.
     */
    static void barrier();

    bool is_loaded() const { return program_ != 0; }
    void destroy();

private:
    unsigned int program_ = 0;
};

/**
 * @brief Terrain mesh generator: one invocation per vertex, group size 64.
 *
 * Buffers are sized once for the configured chunk dimensions and
 * overwritten by every generate_chunk().
 */
class TerrainMeshKernel {
public:
    bool init(const terrain::TerrainConfig& config);

    /**
     * @brief Dispatch the kernel for one chunk.
     * @return false if the descriptor does not fit the allocated buffers
     */
    bool generate_chunk(const terrain::ChunkDescriptor& desc);

    /**
     * @brief Read the last generated chunk back into host memory.
     */
    bool download_chunk(terrain::ChunkMesh& mesh);

    void destroy();

private:
    ComputeShader shader_;

    GPUBuffer chunk_buffer_;   // ChunkDescriptor, std140 uniform block
    GPUBuffer vertex_buffer_;  // Vertex[(w+1)*(h+1)], 32 byte stride
    GPUBuffer index_buffer_;   // uint[w*h*6]

    terrain::ChunkDescriptor current_;
    size_t max_vertices_ = 0;
    size_t max_indices_ = 0;
};

/**
 * @brief Single-invocation probe kernels (mesh scan and plane placeholder).
 */
class ProbeKernel {
public:
    /**
     * @brief Allocate staging mesh buffers for up to the given counts.
     */
    bool init(size_t max_vertices, size_t max_indices);

    void set_camera(const probe::CameraState& camera);

    /**
     * @brief Copy a host chunk into the kernel's own mesh buffers.
     */
    bool upload_mesh(const terrain::ChunkMesh& mesh);

    /**
     * @brief Scan the uploaded mesh. Returns MISS_DISTANCE when nothing hit
     *        or the result could not be read back.
     */
    float probe_mesh(const Ray& ray, uint32_t scan_bound);

    /**
     * @brief Scan an arbitrary pair of vertex and index buffers.
     */
    float probe_mesh(const Ray& ray, uint32_t scan_bound,
                     GPUBuffer& vertices, GPUBuffer& indices, size_t index_count);

    float probe_plane(probe::PlaneProbeMode mode);

    void destroy();

private:
    ComputeShader mesh_shader_;
    ComputeShader plane_shader_;

    GPUBuffer camera_buffer_;  // CameraUniform, std140 uniform block
    GPUBuffer vertex_buffer_;
    GPUBuffer index_buffer_;
    GPUBuffer result_buffer_;  // float[1]

    size_t max_vertices_ = 0;
    size_t max_indices_ = 0;
    size_t uploaded_indices_ = 0;

    float read_result();
};

} // namespace gpu
} // namespace ridgeline
