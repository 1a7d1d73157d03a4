#pragma once

/**
 * @file renderer.hpp
 * @brief Raylib-based 3D viewer for generated terrain chunks.
 *
 * Features:
 * - Free-fly camera (hold right mouse to look, WASD to move)
 * - Chunk meshes uploaded from host ChunkMesh copies
 * - Probe hit markers
 */

#include "raylib.h"

#include <string>
#include <unordered_map>

#include <ridgeline/probe/ray.hpp>
#include <ridgeline/terrain/chunk.hpp>

namespace ridgeline {
namespace renderer {

/**
 * @brief Renderer configuration.
 */
struct RendererConfig {
  int window_width = 1280;
  int window_height = 720;
  std::string title = "Ridgeline";
  int target_fps = 60;
  int chunk_radius = 1;        // Chunks generated around the origin (3x3)
  float near_plane = 0.1f;
  float far_plane = 1000.0f;
};

/**
 * @brief Terrain chunk viewer.
 */
class Renderer {
public:
  Renderer() = default;
  ~Renderer() = default;

  // Lifecycle
  void init(const RendererConfig &config);
  void shutdown();
  bool should_close() const;

  // Input handling
  void update_input();

  // Chunk meshes
  bool upload_chunk(const terrain::ChunkMesh &mesh);
  void clear_chunks();
  size_t chunk_count() const { return chunk_models_.size(); }

  // Rendering
  void begin_frame();
  void draw_chunks();
  void draw_hit(Vector3 point, Color color);
  void end_frame();

  // State accessors
  probe::CameraState camera_state() const;
  const Camera3D &get_camera() const { return camera_; }
  bool regenerate_requested() const { return regenerate_requested_; }
  void clear_regenerate_request() { regenerate_requested_ = false; }

private:
  RendererConfig config_;
  Camera3D camera_{};
  std::unordered_map<std::string, Model> chunk_models_;
  bool regenerate_requested_ = false;
};

// === Inline implementations ===

inline bool Renderer::should_close() const { return WindowShouldClose(); }

} // namespace renderer
} // namespace ridgeline
