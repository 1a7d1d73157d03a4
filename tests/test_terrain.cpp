/**
 * @file test_terrain.cpp
 * @brief Unit tests for noise, height sampling and mesh building.
 */

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <random>
#include <vector>

#include <ridgeline/core/constants.hpp>
#include <ridgeline/terrain/chunk.hpp>
#include <ridgeline/terrain/height_sampler.hpp>
#include <ridgeline/terrain/mesh_builder.hpp>
#include <ridgeline/terrain/noise.hpp>

#include "raymath.h"

using namespace ridgeline;

namespace {

terrain::ChunkDescriptor make_desc(uint32_t w, uint32_t h, int32_t cx, int32_t cy,
                                   float min_h, float max_h) {
  terrain::ChunkDescriptor desc;
  desc.size_x = w;
  desc.size_y = h;
  desc.corner_x = cx;
  desc.corner_y = cy;
  desc.min_max_height = {min_h, max_h};
  return desc;
}

bool same_bytes(const terrain::ChunkMesh &a, const terrain::ChunkMesh &b) {
  return a.vertices.size() == b.vertices.size() && a.indices.size() == b.indices.size() &&
         std::memcmp(a.vertices.data(), b.vertices.data(),
                     a.vertices.size() * sizeof(terrain::Vertex)) == 0 &&
         std::memcmp(a.indices.data(), b.indices.data(),
                     a.indices.size() * sizeof(uint32_t)) == 0;
}

} // namespace

void test_fbm() {
  std::cout << "Testing fbm..." << std::endl;

  std::mt19937 gen(1234);
  std::uniform_real_distribution<float> dist(-10000.0f, 10000.0f);

  float lo = 0.0f, hi = 0.0f;
  for (int i = 0; i < 10000; ++i) {
    Vector2 p = {dist(gen), dist(gen)};
    float a = terrain::fbm(p);
    float b = terrain::fbm(p);
    assert(a == b);
    assert(std::abs(a) <= 1.5f);
    lo = std::min(lo, a);
    hi = std::max(hi, a);
  }
  // Not a constant field
  assert(hi - lo > 0.1f);

  std::cout << "  fbm: PASS" << std::endl;
}

void test_snoise_continuity() {
  std::cout << "Testing snoise2 continuity..." << std::endl;

  std::mt19937 gen(99);
  std::uniform_real_distribution<float> dist(-300.0f, 300.0f);
  for (int i = 0; i < 1000; ++i) {
    Vector2 p = {dist(gen), dist(gen)};
    float a = terrain::snoise2(p);
    float b = terrain::snoise2({p.x + 1e-3f, p.y});
    float c = terrain::snoise2({p.x, p.y + 1e-3f});
    assert(std::abs(a) <= 1.1f);
    assert(std::abs(a - b) < 0.05f);
    assert(std::abs(a - c) < 0.05f);
  }

  std::cout << "  snoise2: PASS" << std::endl;
}

void test_mesh_counts() {
  std::cout << "Testing mesh counts..." << std::endl;

  const terrain::ChunkDescriptor descs[] = {
      make_desc(1, 1, 0, 0, -5.0f, 5.0f),
      make_desc(2, 3, 10, -4, -5.0f, 5.0f),
      make_desc(5, 1, -64, -64, 0.0f, 20.0f),
      make_desc(32, 32, 32, 0, -5.0f, 5.0f),
  };

  for (const auto &desc : descs) {
    terrain::ChunkMesh mesh;
    terrain::build_chunk(desc, mesh);

    size_t w = desc.size_x, h = desc.size_y;
    assert(mesh.vertices.size() == (w + 1) * (h + 1));
    assert(mesh.indices.size() == w * h * 6);
    for (uint32_t index : mesh.indices) {
      assert(index < mesh.vertices.size());
    }
  }

  std::cout << "  Mesh counts: PASS" << std::endl;
}

void test_cell_topology() {
  std::cout << "Testing cell topology..." << std::endl;

  terrain::ChunkMesh mesh;
  terrain::build_chunk(make_desc(2, 2, 0, 0, 0.0f, 0.0f), mesh);

  // Lattice is 3 wide: cell 0 = v0,v1,v3,v4; cell 3 = v4,v5,v7,v8
  const uint32_t cell0[6] = {0, 3, 4, 0, 4, 1};
  const uint32_t cell3[6] = {4, 7, 8, 4, 8, 5};
  for (int k = 0; k < 6; ++k) {
    assert(mesh.indices[k] == cell0[k]);
    assert(mesh.indices[18 + k] == cell3[k]);
  }

  std::cout << "  Cell topology: PASS" << std::endl;
}

void test_vertex_positions() {
  std::cout << "Testing vertex positions..." << std::endl;

  terrain::ChunkDescriptor desc = make_desc(4, 3, -8, 12, -5.0f, 5.0f);
  terrain::ChunkMesh mesh;
  terrain::build_chunk(desc, mesh);

  for (size_t i = 0; i < mesh.vertices.size(); ++i) {
    const Vector3 &p = mesh.vertices[i].position;
    assert(p.x == static_cast<float>(static_cast<int>(i % 5) + desc.corner_x));
    assert(p.z == static_cast<float>(static_cast<int>(i / 5) + desc.corner_y));
    assert(p.y == terrain::terrain_point({p.x, p.z}, desc.min_max_height).y);
  }

  std::cout << "  Vertex positions: PASS" << std::endl;
}

void test_flat_normals() {
  std::cout << "Testing flat heightfield normals..." << std::endl;

  const float heights[] = {0.0f, 3.5f, -2.0f};
  for (float h : heights) {
    terrain::ChunkMesh mesh;
    terrain::build_chunk(make_desc(6, 4, -3, 7, h, h), mesh);
    for (const auto &v : mesh.vertices) {
      assert(v.position.y == h);
      assert(v.normal.x == 0.0f);
      assert(v.normal.y == 1.0f);
      assert(v.normal.z == 0.0f);
    }
  }

  std::cout << "  Flat normals: PASS" << std::endl;
}

void test_winding() {
  std::cout << "Testing triangle winding..." << std::endl;

  const terrain::ChunkDescriptor descs[] = {
      make_desc(8, 8, 0, 0, 0.0f, 0.0f),
      make_desc(16, 16, -40, 25, -5.0f, 5.0f),
  };

  for (const auto &desc : descs) {
    terrain::ChunkMesh mesh;
    terrain::build_chunk(desc, mesh);

    for (size_t c = 0; c < mesh.indices.size(); c += 6) {
      const terrain::Vertex &v00 = mesh.vertices[mesh.indices[c + 0]];
      const terrain::Vertex &v01 = mesh.vertices[mesh.indices[c + 1]];
      const terrain::Vertex &v11 = mesh.vertices[mesh.indices[c + 2]];
      const terrain::Vertex &v10 = mesh.vertices[mesh.indices[c + 5]];

      Vector3 face_a = Vector3CrossProduct(Vector3Subtract(v01.position, v00.position),
                                           Vector3Subtract(v11.position, v00.position));
      Vector3 face_b = Vector3CrossProduct(Vector3Subtract(v11.position, v00.position),
                                           Vector3Subtract(v10.position, v00.position));
      assert(Vector3DotProduct(face_a, v00.normal) >= 0.0f);
      assert(Vector3DotProduct(face_b, v00.normal) >= 0.0f);
    }
  }

  std::cout << "  Winding: PASS" << std::endl;
}

void test_idempotent() {
  std::cout << "Testing regeneration..." << std::endl;

  terrain::ChunkDescriptor desc = make_desc(32, 32, 64, -32, -5.0f, 5.0f);

  terrain::ChunkMesh first, second, serial;
  terrain::build_chunk(desc, first);
  terrain::build_chunk(desc, second);
  terrain::build_chunk_serial(desc, serial);
  assert(same_bytes(first, second));
  assert(same_bytes(first, serial));

  // Rebuilding into a used mesh overwrites rather than appends
  terrain::ChunkMesh reused;
  terrain::build_chunk(make_desc(40, 40, 0, 0, -9.0f, 9.0f), reused);
  terrain::build_chunk(desc, reused);
  assert(same_bytes(first, reused));

  std::cout << "  Regeneration: PASS" << std::endl;
}

void test_invocation_bounds() {
  std::cout << "Testing invocation bounds..." << std::endl;

  terrain::ChunkDescriptor desc = make_desc(3, 2, 0, 0, -1.0f, 1.0f);
  const size_t nv = terrain::vertex_count(desc);
  const size_t ni = terrain::index_count(desc);

  // One guard slot past the end of each buffer
  std::vector<terrain::Vertex> vertices(nv + 1);
  std::vector<uint32_t> indices(ni + 1, 0xDEADBEEFu);
  vertices[nv].position = {42.0f, 42.0f, 42.0f};

  // Whole groups of 64, tail invocations included
  const uint32_t invocations = terrain::dispatch_groups(desc) * constants::MESH_WORKGROUP_SIZE;
  assert(invocations >= nv);
  for (uint32_t i = 0; i < invocations; ++i) {
    terrain::build_invocation(i, desc, vertices.data(), indices.data());
  }

  assert(vertices[nv].position.x == 42.0f);
  assert(indices[ni] == 0xDEADBEEFu);
  for (size_t k = 0; k < ni; ++k) {
    assert(indices[k] < nv);
  }
  assert(terrain::dispatch_groups(make_desc(32, 32, 0, 0, 0.0f, 0.0f)) == 18);

  std::cout << "  Invocation bounds: PASS" << std::endl;
}

void test_chunk_lookup() {
  std::cout << "Testing chunk lookup..." << std::endl;

  int32_t cx = 0, cz = 0;
  terrain::chunk_corner_for(5.0f, 40.0f, 32, 32, cx, cz);
  assert(cx == 0 && cz == 32);
  terrain::chunk_corner_for(-0.5f, -33.0f, 32, 32, cx, cz);
  assert(cx == -32 && cz == -64);
  terrain::chunk_corner_for(64.0f, 0.0f, 32, 16, cx, cz);
  assert(cx == 64 && cz == 0);

  assert(terrain::chunk_key(-32, -64) == "-32_-64");

  terrain::TerrainConfig config;
  terrain::ChunkDescriptor desc = terrain::make_descriptor(config, 32, -32);
  assert(desc.size_x == 32 && desc.size_y == 32);
  assert(desc.min_max_height.x == -5.0f && desc.min_max_height.y == 5.0f);
  assert(terrain::chunk_contains(desc, 40.0f, -10.0f));
  assert(!terrain::chunk_contains(desc, 10.0f, -10.0f));

  std::cout << "  Chunk lookup: PASS" << std::endl;
}

int main() {
  std::cout << "=== Running Terrain Tests ===" << std::endl;

  test_fbm();
  test_snoise_continuity();
  test_mesh_counts();
  test_cell_topology();
  test_vertex_positions();
  test_flat_normals();
  test_winding();
  test_idempotent();
  test_invocation_bounds();
  test_chunk_lookup();

  std::cout << std::endl;
  std::cout << "All tests PASSED!" << std::endl;
  return 0;
}
