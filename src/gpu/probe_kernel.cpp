/**
 * @file probe_kernel.cpp
 * @brief GPU ray probes: closest-hit mesh scan and plane placeholder.
 */

#include <ridgeline/gpu/gpu_compute.hpp>
#include <ridgeline/core/constants.hpp>

#include <iostream>

namespace ridgeline {
namespace gpu {

// Mirrors probe/intersect.cpp and probe/mesh_probe.cpp
static const char* MESH_PROBE_SHADER = R"(
#version 430 core
layout(local_size_x = 1) in;

layout(std140, binding = 0) uniform CameraData {
    vec4 view_pos;
    mat4 view_proj;
};

struct Vertex {
    vec3 position;
    vec3 normal;
};

layout(std430, binding = 1) readonly buffer Vertices { Vertex vertices[]; };
layout(std430, binding = 2) readonly buffer Indices { uint indices[]; };
layout(std430, binding = 3) writeonly buffer Result { float result[]; };

uniform vec3 ray_origin;
uniform vec3 ray_dir;
uniform uint scan_limit;  // Whole cells, already clamped to the index count

const float NO_HIT = -1.0;
const float MISS_DISTANCE = 1e38;

float intersect_ray_triangle(vec3 origin, vec3 dir, vec3 v0, vec3 v1, vec3 v2) {
    vec3 e1 = v1 - v0;
    vec3 e2 = v2 - v0;
    vec3 h = cross(dir, e2);
    float a = dot(e1, h);
    if (abs(a) < 1e-5) return NO_HIT;

    float f = 1.0 / a;
    vec3 s = origin - v0;
    float u = f * dot(s, h);
    if (u < 0.0 || u > 1.0) return NO_HIT;

    vec3 q = cross(s, e1);
    float v = f * dot(dir, q);
    if (v < 0.0 || u + v > 1.0) return NO_HIT;

    return f * dot(e2, q);
}

void main() {
    uint vertex_count = uint(vertices.length());
    float closest = MISS_DISTANCE;

    for (uint i = 0u; i < scan_limit; i += 6u) {
        uint i00 = indices[i + 0u];
        uint i01 = indices[i + 1u];
        uint i11 = indices[i + 2u];
        uint i10 = indices[i + 5u];
        if (i00 >= vertex_count || i01 >= vertex_count ||
            i11 >= vertex_count || i10 >= vertex_count) continue;

        vec3 v00 = vertices[i00].position;
        vec3 v01 = vertices[i01].position;
        vec3 v11 = vertices[i11].position;
        vec3 v10 = vertices[i10].position;

        float t1 = intersect_ray_triangle(ray_origin, ray_dir, v00, v01, v11);
        if (t1 > 0.0 && t1 < closest) closest = t1;
        float t2 = intersect_ray_triangle(ray_origin, ray_dir, v00, v11, v10);
        if (t2 > 0.0 && t2 < closest) closest = t2;
    }

    result[0] = closest;
}
)";

static const char* PLANE_PROBE_SHADER = R"(
#version 430 core
layout(local_size_x = 1) in;

layout(std140, binding = 0) uniform CameraData {
    vec4 view_pos;
    mat4 view_proj;
};

layout(std430, binding = 3) writeonly buffer Result { float result[]; };

uniform int mode;  // 0 = constant, 1 = camera height

void main() {
    result[0] = (mode == 1) ? view_pos.y : 1.0;
}
)";

bool ProbeKernel::init(size_t max_vertices, size_t max_indices) {
    if (!mesh_shader_.load(MESH_PROBE_SHADER)) {
        std::cerr << "[GPU] Mesh probe shader failed" << std::endl;
        return false;
    }
    if (!plane_shader_.load(PLANE_PROBE_SHADER)) {
        std::cerr << "[GPU] Plane probe shader failed" << std::endl;
        return false;
    }

    max_vertices_ = max_vertices;
    max_indices_ = max_indices;

    camera_buffer_.create(sizeof(probe::CameraUniform), BufferKind::UNIFORM);
    vertex_buffer_.create(max_vertices_ * sizeof(terrain::Vertex));
    index_buffer_.create(max_indices_ * sizeof(uint32_t));
    result_buffer_.create(sizeof(float));

    set_camera(probe::CameraState{});

    std::cout << "[GPU] Probe kernels ready: up to " << max_indices_ << " indices" << std::endl;
    return true;
}

void ProbeKernel::set_camera(const probe::CameraState& camera) {
    probe::CameraUniform uniform = probe::to_uniform(camera);
    camera_buffer_.upload(&uniform, sizeof(uniform));
}

bool ProbeKernel::upload_mesh(const terrain::ChunkMesh& mesh) {
    if (mesh.vertices.size() > max_vertices_ || mesh.indices.size() > max_indices_) {
        std::cerr << "[GPU] Mesh with " << mesh.indices.size()
                  << " indices exceeds probe buffers" << std::endl;
        return false;
    }
    vertex_buffer_.upload(mesh.vertices.data(), mesh.vertices.size() * sizeof(terrain::Vertex));
    index_buffer_.upload(mesh.indices.data(), mesh.indices.size() * sizeof(uint32_t));
    uploaded_indices_ = mesh.indices.size();
    return true;
}

float ProbeKernel::probe_mesh(const Ray& ray, uint32_t scan_bound) {
    return probe_mesh(ray, scan_bound, vertex_buffer_, index_buffer_, uploaded_indices_);
}

float ProbeKernel::probe_mesh(const Ray& ray, uint32_t scan_bound,
                              GPUBuffer& vertices, GPUBuffer& indices, size_t index_count) {
    mesh_shader_.bind_uniform_block(0, camera_buffer_);
    mesh_shader_.bind_buffer(1, vertices);
    mesh_shader_.bind_buffer(2, indices);
    mesh_shader_.bind_buffer(3, result_buffer_);

    mesh_shader_.set_uniform("ray_origin", ray.position);
    mesh_shader_.set_uniform("ray_dir", ray.direction);
    mesh_shader_.set_uniform("scan_limit",
                             static_cast<unsigned int>(probe::scan_limit(scan_bound, index_count)));

    mesh_shader_.dispatch(1, 1, 1);
    ComputeShader::barrier();
    return read_result();
}

float ProbeKernel::probe_plane(probe::PlaneProbeMode mode) {
    plane_shader_.bind_uniform_block(0, camera_buffer_);
    plane_shader_.bind_buffer(3, result_buffer_);
    plane_shader_.set_uniform("mode", mode == probe::PlaneProbeMode::CAMERA_HEIGHT ? 1 : 0);

    plane_shader_.dispatch(1, 1, 1);
    ComputeShader::barrier();
    return read_result();
}

float ProbeKernel::read_result() {
    float value = constants::MISS_DISTANCE;
    if (!result_buffer_.download(&value, sizeof(float))) {
        std::cerr << "[GPU] Probe result unavailable, reporting a miss" << std::endl;
        return constants::MISS_DISTANCE;
    }
    return value;
}

void ProbeKernel::destroy() {
    mesh_shader_.destroy();
    plane_shader_.destroy();
    camera_buffer_.destroy();
    vertex_buffer_.destroy();
    index_buffer_.destroy();
    result_buffer_.destroy();
}

} // namespace gpu
} // namespace ridgeline
