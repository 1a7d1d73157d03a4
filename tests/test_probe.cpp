/**
 * @file test_probe.cpp
 * @brief Unit tests for ray-triangle intersection and the terrain probes.
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include <ridgeline/core/constants.hpp>
#include <ridgeline/probe/intersect.hpp>
#include <ridgeline/probe/mesh_probe.hpp>
#include <ridgeline/probe/plane_probe.hpp>
#include <ridgeline/probe/ray.hpp>
#include <ridgeline/terrain/mesh_builder.hpp>

#include "raymath.h"

using namespace ridgeline;

namespace {

terrain::ChunkMesh flat_chunk(uint32_t w, uint32_t h, int32_t cx, int32_t cy, float height) {
  terrain::ChunkDescriptor desc;
  desc.size_x = w;
  desc.size_y = h;
  desc.corner_x = cx;
  desc.corner_y = cy;
  desc.min_max_height = {height, height};
  terrain::ChunkMesh mesh;
  terrain::build_chunk(desc, mesh);
  return mesh;
}

Ray make_ray(Vector3 origin, Vector3 direction) {
  Ray ray;
  ray.position = origin;
  ray.direction = Vector3Normalize(direction);
  return ray;
}

bool near(float a, float b, float eps) { return std::abs(a - b) < eps; }

} // namespace

void test_intersect() {
  std::cout << "Testing ray-triangle intersection..." << std::endl;

  const Vector3 v0 = {0.0f, 0.0f, 0.0f};
  const Vector3 v1 = {1.0f, 0.0f, 0.0f};
  const Vector3 v2 = {0.0f, 0.0f, 1.0f};
  const float third = 1.0f / 3.0f;

  // Through the centroid along the normal
  float t = probe::intersect_ray_triangle(make_ray({third, 4.0f, third}, {0, -1, 0}), v0, v1, v2);
  assert(near(t, 4.0f, 1e-5f));

  // Aimed past the triangle
  t = probe::intersect_ray_triangle(make_ray({third, 4.0f, third}, {5.0f, -4.0f, 5.0f}), v0, v1, v2);
  assert(t == constants::NO_HIT);

  // Parallel to the plane
  t = probe::intersect_ray_triangle(make_ray({-1.0f, 0.5f, 0.2f}, {1, 0, 0}), v0, v1, v2);
  assert(t == constants::NO_HIT);

  // Triangle behind the origin yields a non-positive distance, never a hit
  t = probe::intersect_ray_triangle(make_ray({third, 4.0f, third}, {0, 1, 0}), v0, v1, v2);
  assert(t <= 0.0f);
  assert(!probe::is_hit(t));

  assert(probe::is_hit(0.5f));
  assert(!probe::is_hit(constants::MISS_DISTANCE));
  assert(!probe::is_hit(constants::NO_HIT));

  std::cout << "  Intersection: PASS" << std::endl;
}

void test_flat_probe() {
  std::cout << "Testing probe over flat chunk..." << std::endl;

  terrain::ChunkMesh mesh = flat_chunk(2, 2, 0, 0, 0.0f);
  Ray down = make_ray({1.0f, 5.0f, 1.0f}, {0, -1, 0});

  probe::ResultBuffer result;
  float d = probe::probe_mesh(down, mesh.vertices, mesh.indices, probe::SCAN_ALL, result);
  assert(near(d, 5.0f, 1e-5f));
  assert(result.size() == 1 && result[0] == d);

  probe::ResultBuffer parallel_result(1, 0.0f);
  float dp = probe::probe_mesh_parallel(down, mesh.vertices, mesh.indices, probe::SCAN_ALL,
                                        parallel_result);
  assert(dp == d);
  assert(parallel_result[0] == d);

  // Outside the footprint
  d = probe::probe_mesh(make_ray({10.0f, 5.0f, 10.0f}, {0, -1, 0}), mesh.vertices, mesh.indices,
                        probe::SCAN_ALL, result);
  assert(d == constants::MISS_DISTANCE);
  assert(result[0] == constants::MISS_DISTANCE);

  // Surface behind the ray
  d = probe::probe_mesh(make_ray({1.0f, 5.0f, 1.0f}, {0, 1, 0}), mesh.vertices, mesh.indices,
                        probe::SCAN_ALL, result);
  assert(d == constants::MISS_DISTANCE);

  std::cout << "  Flat probe: PASS" << std::endl;
}

void test_closest_hit() {
  std::cout << "Testing closest hit on noisy chunk..." << std::endl;

  terrain::ChunkDescriptor desc;
  desc.size_x = 8;
  desc.size_y = 8;
  desc.corner_x = 96;
  desc.corner_y = -40;
  desc.min_max_height = {-5.0f, 5.0f};
  terrain::ChunkMesh mesh;
  terrain::build_chunk(desc, mesh);

  const Ray rays[] = {
      make_ray({99.3f, 50.0f, -35.3f}, {0, -1, 0}),
      make_ray({90.0f, 20.0f, -45.0f}, {1.0f, -1.5f, 1.0f}),
      make_ray({200.0f, 20.0f, 0.0f}, {0, -1, 0}),
  };

  for (const Ray &ray : rays) {
    // Reference: every triangle, nearest positive distance
    float expected = constants::MISS_DISTANCE;
    for (size_t c = 0; c < mesh.indices.size(); c += 3) {
      float t = probe::intersect_ray_triangle(ray, mesh.vertices[mesh.indices[c]].position,
                                              mesh.vertices[mesh.indices[c + 1]].position,
                                              mesh.vertices[mesh.indices[c + 2]].position);
      if (t > 0.0f && t < expected) expected = t;
    }

    probe::ResultBuffer serial, parallel;
    float ds = probe::probe_mesh(ray, mesh.vertices, mesh.indices, probe::SCAN_ALL, serial);
    float dp = probe::probe_mesh_parallel(ray, mesh.vertices, mesh.indices, probe::SCAN_ALL,
                                          parallel);
    assert(ds == expected);
    assert(dp == ds);
  }

  // Straight down lands on the sampled surface height
  probe::ResultBuffer result;
  float d = probe::probe_mesh(rays[0], mesh.vertices, mesh.indices, probe::SCAN_ALL, result);
  assert(probe::is_hit(d));
  float ground = probe::ray_at(rays[0], d).y;
  assert(ground >= -5.0f && ground <= 5.0f);

  std::cout << "  Closest hit: PASS" << std::endl;
}

void test_scan_bound() {
  std::cout << "Testing scan bound..." << std::endl;

  assert(probe::scan_limit(constants::LEGACY_SCAN_BOUND, 9600) == 6144);
  assert(probe::scan_limit(probe::SCAN_ALL, 9600) == 9600);
  assert(probe::scan_limit(constants::LEGACY_SCAN_BOUND, 24) == 24);
  assert(probe::scan_limit(10, 24) == 6);

  // 40x40 chunk: 9600 indices, only the first 1024 cells are reachable
  terrain::ChunkMesh mesh = flat_chunk(40, 40, 0, 0, 0.0f);
  assert(mesh.indices.size() == 9600);

  probe::ProbeConfig legacy;
  probe::ProbeConfig full;
  full.scan_bound = probe::SCAN_ALL;
  probe::ResultBuffer result;

  // Cell 30*40+20 lies past the bound
  Ray far_cell = make_ray({20.5f, 5.0f, 30.5f}, {0, -1, 0});
  assert(probe::probe_mesh(far_cell, mesh, legacy, result) == constants::MISS_DISTANCE);
  assert(probe::probe_mesh_parallel(far_cell, mesh, legacy, result) == constants::MISS_DISTANCE);
  assert(near(probe::probe_mesh(far_cell, mesh, full, result), 5.0f, 1e-5f));
  assert(near(probe::probe_mesh_parallel(far_cell, mesh, full, result), 5.0f, 1e-5f));

  // Cell 10*40+20 is within it
  Ray near_cell = make_ray({20.5f, 5.0f, 10.5f}, {0, -1, 0});
  assert(near(probe::probe_mesh(near_cell, mesh, legacy, result), 5.0f, 1e-5f));

  std::cout << "  Scan bound: PASS" << std::endl;
}

void test_bad_indices() {
  std::cout << "Testing out-of-range indices..." << std::endl;

  terrain::ChunkMesh mesh = flat_chunk(1, 1, 0, 0, 0.0f);
  Ray down = make_ray({0.5f, 2.0f, 0.5f}, {0, -1, 0});

  std::vector<uint32_t> bad = mesh.indices;
  bad[2] = 999;
  assert(probe::probe_cell(down, mesh.vertices.data(), mesh.vertices.size(), bad.data(), 0) ==
         constants::MISS_DISTANCE);

  probe::ResultBuffer result;
  assert(probe::probe_mesh(down, mesh.vertices, bad, probe::SCAN_ALL, result) ==
         constants::MISS_DISTANCE);
  assert(near(probe::probe_mesh(down, mesh.vertices, mesh.indices, probe::SCAN_ALL, result),
              2.0f, 1e-5f));

  std::cout << "  Out-of-range indices: PASS" << std::endl;
}

void test_plane_probe() {
  std::cout << "Testing plane probe..." << std::endl;

  probe::CameraState camera;
  camera.view_pos = {3.0f, 7.5f, -2.0f, 1.0f};

  std::vector<float> result;
  assert(probe::probe_plane(camera, probe::PlaneProbeMode::CAMERA_HEIGHT, result) == 7.5f);
  assert(result.size() == 1 && result[0] == 7.5f);

  assert(probe::probe_plane(camera, probe::PlaneProbeMode::CONSTANT, result) ==
         probe::PLANE_PROBE_CONSTANT);
  assert(result[0] == 1.0f);

  std::cout << "  Plane probe: PASS" << std::endl;
}

void test_rays() {
  std::cout << "Testing probe rays..." << std::endl;

  Camera3D cam = {};
  cam.position = {16.0f, 10.0f, 6.0f};
  cam.target = {16.0f, 0.0f, 16.0f};
  cam.up = {0.0f, 1.0f, 0.0f};
  cam.fovy = 60.0f;
  cam.projection = CAMERA_PERSPECTIVE;

  probe::CameraState state = probe::camera_state(cam, 16.0f / 9.0f, 0.1f, 1000.0f);
  assert(state.view_pos.x == 16.0f && state.view_pos.y == 10.0f && state.view_pos.w == 1.0f);

  probe::CameraUniform uniform = probe::to_uniform(state);
  assert(uniform.view_pos.y == 10.0f);

  Ray down = probe::downward_ray(state);
  assert(down.position.x == 16.0f && down.position.y == 10.0f && down.position.z == 6.0f);
  assert(down.direction.x == 0.0f && down.direction.y == -1.0f && down.direction.z == 0.0f);

  Vector2 ndc = probe::screen_to_ndc({640.0f, 360.0f}, 1280.0f, 720.0f);
  assert(ndc.x == 0.0f && ndc.y == 0.0f);
  ndc = probe::screen_to_ndc({0.0f, 0.0f}, 1280.0f, 720.0f);
  assert(ndc.x == -1.0f && ndc.y == 1.0f);

  // Screen centre looks along camera -> target
  Ray pick = probe::pick_ray(state, {0.0f, 0.0f});
  const float inv_sqrt2 = 1.0f / std::sqrt(2.0f);
  assert(near(pick.direction.x, 0.0f, 1e-3f));
  assert(near(pick.direction.y, -inv_sqrt2, 1e-3f));
  assert(near(pick.direction.z, inv_sqrt2, 1e-3f));
  assert(Vector3Distance(pick.position, cam.position) < 0.2f);

  terrain::ChunkMesh mesh = flat_chunk(32, 32, 0, 0, 0.0f);
  probe::ResultBuffer result;
  float d = probe::probe_mesh_parallel(pick, mesh.vertices, mesh.indices, probe::SCAN_ALL, result);
  assert(probe::is_hit(d));
  Vector3 hit = probe::ray_at(pick, d);
  assert(near(hit.x, 16.0f, 0.05f));
  assert(near(hit.y, 0.0f, 1e-3f));
  assert(near(hit.z, 16.0f, 0.05f));

  std::cout << "  Probe rays: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Probe Tests ===" << std::endl;

  test_intersect();
  test_flat_probe();
  test_closest_hit();
  test_scan_bound();
  test_bad_indices();
  test_plane_probe();
  test_rays();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
