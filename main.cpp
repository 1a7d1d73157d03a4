/**
 * @file main.cpp
 * @brief Entry point for the Ridgeline terrain viewer.
 */

#include <iostream>
#include <string>
#include <unordered_map>

#include "raylib.h"

#include <ridgeline/core/constants.hpp>
#include <ridgeline/gpu/gpu_compute.hpp>
#include <ridgeline/probe/intersect.hpp>
#include <ridgeline/probe/mesh_probe.hpp>
#include <ridgeline/probe/plane_probe.hpp>
#include <ridgeline/probe/ray.hpp>
#include <ridgeline/renderer/debug_ui.hpp>
#include <ridgeline/renderer/renderer.hpp>
#include <ridgeline/terrain/chunk.hpp>
#include <ridgeline/terrain/mesh_builder.hpp>

using namespace ridgeline;

namespace {

// Chunk containing the point where a ray crosses the given height, if any
const terrain::ChunkMesh *chunk_under_ray(
    const std::unordered_map<std::string, terrain::ChunkMesh> &chunks,
    const terrain::TerrainConfig &config, const Ray &ray, float height) {
  if (ray.direction.y == 0.0f) return nullptr;
  float t = (height - ray.position.y) / ray.direction.y;
  if (t < 0.0f) return nullptr;

  Vector3 ground = probe::ray_at(ray, t);
  int32_t cx = 0, cz = 0;
  terrain::chunk_corner_for(ground.x, ground.z, config.chunk_size_x, config.chunk_size_y, cx, cz);
  auto it = chunks.find(terrain::chunk_key(cx, cz));
  return it == chunks.end() ? nullptr : &it->second;
}

} // namespace

int main() {
  std::cout << "=== Ridgeline Terrain Viewer ===" << std::endl;
  std::cout << "Initializing systems..." << std::endl;

  terrain::TerrainConfig terrain_config;
  probe::ProbeConfig probe_config;

  // Initialize Renderer (creates the GL context the kernels need)
  renderer::RendererConfig render_config;
  render_config.title = "Ridgeline - Terrain Probe";
  render_config.chunk_radius = 1;

  renderer::Renderer viewer;
  viewer.init(render_config);
  std::cout << "[OK] Renderer: " << render_config.window_width << "x"
            << render_config.window_height << " window" << std::endl;

  renderer::DebugUI debug_ui;
  debug_ui.init();
  std::cout << "[OK] Debug UI: Dear ImGui initialized" << std::endl;

  // GPU kernels, CPU fallback when the compute shaders fail
  terrain::ChunkDescriptor sizing = terrain::make_descriptor(terrain_config, 0, 0);

  gpu::TerrainMeshKernel gpu_terrain;
  bool gpu_terrain_ready = terrain_config.use_gpu && gpu_terrain.init(terrain_config);
  if (gpu_terrain_ready) {
    std::cout << "[OK] GPU: Terrain mesh kernel ready" << std::endl;
  } else {
    std::cout << "[WARN] GPU: Terrain mesh kernel failed, using CPU fallback" << std::endl;
  }

  gpu::ProbeKernel gpu_probe;
  bool gpu_probe_ready = terrain_config.use_gpu &&
      gpu_probe.init(terrain::vertex_count(sizing), terrain::index_count(sizing));
  if (gpu_probe_ready) {
    std::cout << "[OK] GPU: Probe kernels ready" << std::endl;
  } else {
    std::cout << "[WARN] GPU: Probe kernels failed, using CPU fallback" << std::endl;
  }

  std::unordered_map<std::string, terrain::ChunkMesh> chunks;

  auto generate_chunks = [&]() {
    chunks.clear();
    viewer.clear_chunks();

    const int r = render_config.chunk_radius;
    for (int dz = -r; dz <= r; ++dz) {
      for (int dx = -r; dx <= r; ++dx) {
        terrain::ChunkDescriptor desc = terrain::make_descriptor(
            terrain_config,
            dx * static_cast<int32_t>(terrain_config.chunk_size_x),
            dz * static_cast<int32_t>(terrain_config.chunk_size_y));

        terrain::ChunkMesh mesh;
        bool on_gpu = gpu_terrain_ready && gpu_terrain.generate_chunk(desc) &&
                      gpu_terrain.download_chunk(mesh);
        if (!on_gpu) {
          terrain::build_chunk(desc, mesh);
        }

        viewer.upload_chunk(mesh);
        chunks[terrain::chunk_key(desc.corner_x, desc.corner_y)] = std::move(mesh);
      }
    }

    std::string msg = "Generated " + std::to_string(chunks.size()) + " chunks, height [" +
                      std::to_string(terrain_config.min_max_height.x) + ", " +
                      std::to_string(terrain_config.min_max_height.y) + "]";
    std::cout << "[OK] World: " << msg << std::endl;
    debug_ui.add_log(GetTime(), msg);
  };

  generate_chunks();

  // Runs one probe on the GPU when available, otherwise the CPU reduction
  probe::ResultBuffer result(1, constants::MISS_DISTANCE);
  auto probe_chunk = [&](const terrain::ChunkMesh *mesh, const Ray &ray) {
    if (!mesh) return constants::MISS_DISTANCE;
    if (gpu_probe_ready && gpu_probe.upload_mesh(*mesh)) {
      return gpu_probe.probe_mesh(ray, probe_config.scan_bound);
    }
    return probe::probe_mesh_parallel(ray, *mesh, probe_config, result);
  };

  std::cout << std::endl;
  std::cout << "=== Viewer Running ===" << std::endl;
  std::cout << "Controls:" << std::endl;
  std::cout << "  Right mouse + WASD: Fly camera" << std::endl;
  std::cout << "  R: Regenerate chunks" << std::endl;
  std::cout << std::endl;

  while (!viewer.should_close()) {
    if (!debug_ui.is_capturing_mouse()) {
      viewer.update_input();
    }
    if (viewer.regenerate_requested()) {
      generate_chunks();
      viewer.clear_regenerate_request();
    }

    probe::CameraState camera = viewer.camera_state();
    if (gpu_probe_ready) {
      gpu_probe.set_camera(camera);
    }

    // Downward probe against the chunk below the camera
    Ray down = probe::downward_ray(camera);
    int32_t cx = 0, cz = 0;
    terrain::chunk_corner_for(camera.view_pos.x, camera.view_pos.z,
                              terrain_config.chunk_size_x, terrain_config.chunk_size_y, cx, cz);
    auto below = chunks.find(terrain::chunk_key(cx, cz));

    renderer::ProbeReadout readout;
    readout.gpu = gpu_probe_ready;
    readout.ground_distance = probe_chunk(below == chunks.end() ? nullptr : &below->second, down);

    // Cursor pick ray against the chunk under the cursor's ground point
    Vector2 ndc = probe::screen_to_ndc(GetMousePosition(),
                                       static_cast<float>(GetScreenWidth()),
                                       static_cast<float>(GetScreenHeight()));
    Ray pick = probe::pick_ray(camera, ndc);
    float mid_height = 0.5f * (terrain_config.min_max_height.x + terrain_config.min_max_height.y);
    readout.pick_distance = probe_chunk(chunk_under_ray(chunks, terrain_config, pick, mid_height), pick);

    readout.plane_value = gpu_probe_ready
        ? gpu_probe.probe_plane(probe_config.plane_mode)
        : probe::probe_plane(camera, probe_config.plane_mode, result);

    bool hit = probe::is_hit(readout.pick_distance);
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && !debug_ui.is_capturing_mouse()) {
      if (hit) {
        Vector3 p = probe::ray_at(pick, readout.pick_distance);
        debug_ui.add_log(GetTime(), "Pick at (" + std::to_string(p.x) + ", " +
                                        std::to_string(p.y) + ", " + std::to_string(p.z) + ")");
      } else {
        debug_ui.add_log(GetTime(), "Pick missed terrain", 1);
      }
    }

    // Render
    viewer.begin_frame();
    viewer.draw_chunks();
    if (probe::is_hit(readout.ground_distance)) {
      viewer.draw_hit(probe::ray_at(down, readout.ground_distance), SKYBLUE);
    }
    if (hit) {
      viewer.draw_hit(probe::ray_at(pick, readout.pick_distance), GOLD);
    }
    EndMode3D();

    debug_ui.begin_frame();
    if (debug_ui.draw_sidebar(terrain_config, probe_config, readout,
                              gpu_terrain_ready, viewer.chunk_count())) {
      generate_chunks();
    }
    debug_ui.end_frame();

    viewer.end_frame();
  }

  // Cleanup
  gpu_probe.destroy();
  gpu_terrain.destroy();
  debug_ui.shutdown();
  viewer.shutdown();

  std::cout << std::endl;
  std::cout << "=== Viewer Closed ===" << std::endl;
  return 0;
}
