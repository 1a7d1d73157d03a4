/**
 * @file terrain_kernel.cpp
 * @brief GPU heightfield mesh generation.
 */

#include <ridgeline/gpu/gpu_compute.hpp>
#include <ridgeline/core/constants.hpp>
#include <ridgeline/terrain/mesh_builder.hpp>

#include <iostream>

namespace ridgeline {
namespace gpu {

// Mirrors terrain/noise.cpp, terrain/height_sampler.cpp and
// terrain/mesh_builder.cpp.
static const char* TERRAIN_MESH_SHADER = R"(
#version 430 core
layout(local_size_x = 64) in;

layout(std140, binding = 0) uniform ChunkData {
    uvec2 chunk_size;
    ivec2 chunk_corner;
    vec2 min_max_height;
};

struct Vertex {
    vec3 position;
    vec3 normal;
};

layout(std430, binding = 1) writeonly buffer Vertices { Vertex vertices[]; };
layout(std430, binding = 2) writeonly buffer Indices { uint indices[]; };

// 2D simplex noise, 289-periodic polynomial permutation
vec3 mod289(vec3 x) { return mod(x, 289.0); }
vec2 mod289(vec2 x) { return mod(x, 289.0); }
vec3 permute(vec3 x) { return mod289(((x * 34.0) + 1.0) * x); }

float snoise2(vec2 v) {
    const vec4 C = vec4(0.211324865405187, 0.366025403784439,
                        -0.577350269189626, 0.024390243902439);
    vec2 i = floor(v + dot(v, C.yy));
    vec2 x0 = v - i + dot(i, C.xx);
    vec2 i1 = (x0.x > x0.y) ? vec2(1.0, 0.0) : vec2(0.0, 1.0);
    vec4 x12 = x0.xyxy + C.xxzz;
    x12.xy -= i1;
    i = mod289(i);
    vec3 p = permute(permute(i.y + vec3(0.0, i1.y, 1.0)) + i.x + vec3(0.0, i1.x, 1.0));
    vec3 m = max(0.5 - vec3(dot(x0, x0), dot(x12.xy, x12.xy), dot(x12.zw, x12.zw)), 0.0);
    m = m * m;
    m = m * m;
    vec3 x = 2.0 * fract(p * C.www) - 1.0;
    vec3 h = abs(x) - 0.5;
    vec3 ox = floor(x + 0.5);
    vec3 a0 = x - ox;
    m *= 1.79284291400159 - 0.85373472095314 * (a0 * a0 + h * h);
    vec3 g;
    g.x = a0.x * x0.x + h.x * x0.y;
    g.yz = a0.yz * x12.xz + h.yz * x12.yw;
    return 130.0 * dot(m, g);
}

const int NUM_OCTAVES = 5;

float fbm(vec2 p) {
    vec2 x = p * 0.01;
    float v = 0.0;
    float a = 0.5;
    vec2 shift = vec2(100.0);
    vec2 cs = vec2(cos(0.5), sin(0.5));
    mat2 rot = mat2(cs.x, cs.y, -cs.y, cs.x);
    for (int i = 0; i < NUM_OCTAVES; ++i) {
        v += a * snoise2(x);
        x = rot * x * 2.0 + shift;
        a *= 0.5;
    }
    return v;
}

vec3 terrain_point(vec2 p) {
    float t = fbm(p);
    return vec3(p.x, min_max_height.x + t * (min_max_height.y - min_max_height.x), p.y);
}

vec3 safe_normalize(vec3 v) {
    float len = length(v);
    return len == 0.0 ? v : v / len;
}

Vertex terrain_vertex(vec2 p) {
    vec3 v = terrain_point(p);
    vec3 tpx = terrain_point(p + vec2(0.1, 0.0)) - v;
    vec3 tpz = terrain_point(p + vec2(0.0, 0.1)) - v;
    vec3 tnx = terrain_point(p + vec2(-0.1, 0.0)) - v;
    vec3 tnz = terrain_point(p + vec2(0.0, -0.1)) - v;

    vec3 pn = safe_normalize(cross(tpz, tpx));
    vec3 nn = safe_normalize(cross(tnz, tnx));

    Vertex vert;
    vert.position = v;
    vert.normal = (pn + nn) * 0.5;
    return vert;
}

void main() {
    uint i = gl_GlobalInvocationID.x;
    uint row = chunk_size.x + 1u;
    uint num_vertices = row * (chunk_size.y + 1u);
    if (i >= num_vertices) return;

    vec2 p = vec2(ivec2(int(i % row), int(i / row)) + chunk_corner);
    vertices[i] = terrain_vertex(p);

    // Cell i; lattice is one wider than the cell grid
    if (i < chunk_size.x * chunk_size.y) {
        uint start = i * 6u;
        uint v00 = i + i / chunk_size.x;
        uint v10 = v00 + 1u;
        uint v01 = v00 + row;
        uint v11 = v01 + 1u;

        indices[start + 0u] = v00;
        indices[start + 1u] = v01;
        indices[start + 2u] = v11;
        indices[start + 3u] = v00;
        indices[start + 4u] = v11;
        indices[start + 5u] = v10;
    }
}
)";

bool TerrainMeshKernel::init(const terrain::TerrainConfig& config) {
    if (!shader_.load(TERRAIN_MESH_SHADER)) {
        std::cerr << "[GPU] Terrain mesh shader failed" << std::endl;
        return false;
    }

    current_ = terrain::make_descriptor(config, 0, 0);
    max_vertices_ = terrain::vertex_count(current_);
    max_indices_ = terrain::index_count(current_);

    chunk_buffer_.create(sizeof(terrain::ChunkDescriptor), BufferKind::UNIFORM);
    vertex_buffer_.create(max_vertices_ * sizeof(terrain::Vertex));
    index_buffer_.create(max_indices_ * sizeof(uint32_t));

    std::cout << "[GPU] Terrain mesh kernel ready: " << config.chunk_size_x << "x"
              << config.chunk_size_y << " cells, " << max_vertices_ << " vertices" << std::endl;
    return true;
}

bool TerrainMeshKernel::generate_chunk(const terrain::ChunkDescriptor& desc) {
    if (terrain::vertex_count(desc) > max_vertices_ ||
        terrain::index_count(desc) > max_indices_) {
        std::cerr << "[GPU] Chunk " << desc.size_x << "x" << desc.size_y
                  << " does not fit the allocated mesh buffers" << std::endl;
        return false;
    }
    current_ = desc;

    chunk_buffer_.upload(&desc, sizeof(desc));
    shader_.bind_uniform_block(0, chunk_buffer_);
    shader_.bind_buffer(1, vertex_buffer_);
    shader_.bind_buffer(2, index_buffer_);

    shader_.dispatch(static_cast<int>(terrain::dispatch_groups(desc)), 1, 1);
    ComputeShader::barrier();
    return true;
}

bool TerrainMeshKernel::download_chunk(terrain::ChunkMesh& mesh) {
    mesh.desc = current_;
    mesh.vertices.resize(terrain::vertex_count(current_));
    mesh.indices.resize(terrain::index_count(current_));

    bool ok = vertex_buffer_.download(mesh.vertices.data(),
                                      mesh.vertices.size() * sizeof(terrain::Vertex));
    ok = index_buffer_.download(mesh.indices.data(),
                                mesh.indices.size() * sizeof(uint32_t)) && ok;
    if (!ok) {
        std::cerr << "[GPU] Failed to read back chunk "
                  << terrain::chunk_key(current_.corner_x, current_.corner_y) << std::endl;
    }
    return ok;
}

void TerrainMeshKernel::destroy() {
    shader_.destroy();
    chunk_buffer_.destroy();
    vertex_buffer_.destroy();
    index_buffer_.destroy();
}

} // namespace gpu
} // namespace ridgeline
