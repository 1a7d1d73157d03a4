/**
 * @file renderer.cpp
 * @brief Implementation of the Raylib-based terrain viewer.
 */

#include <ridgeline/renderer/renderer.hpp>

#include <cstring>
#include <iostream>
#include <limits>

namespace ridgeline {
namespace renderer {

void Renderer::init(const RendererConfig &config) {
  config_ = config;

  // Initialize Raylib window (GL 4.3 context for compute shaders)
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_VSYNC_HINT | FLAG_MSAA_4X_HINT);
  InitWindow(config_.window_width, config_.window_height, config_.title.c_str());
  SetTargetFPS(config_.target_fps);

  // Looking down onto the origin chunk from above its corner
  camera_.position = {-12.0f, 20.0f, -12.0f};
  camera_.target = {16.0f, 0.0f, 16.0f};
  camera_.up = {0.0f, 1.0f, 0.0f};
  camera_.fovy = 60.0f;
  camera_.projection = CAMERA_PERSPECTIVE;
}

void Renderer::shutdown() {
  clear_chunks();
  CloseWindow();
}

void Renderer::update_input() {
  if (IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
    UpdateCamera(&camera_, CAMERA_FREE);
  }
  if (IsKeyPressed(KEY_R)) {
    regenerate_requested_ = true;
  }
}

bool Renderer::upload_chunk(const terrain::ChunkMesh &mesh) {
  if (mesh.vertices.size() > std::numeric_limits<unsigned short>::max()) {
    std::cout << "[WARN] Chunk " << terrain::chunk_key(mesh.desc.corner_x, mesh.desc.corner_y)
              << " has too many vertices for 16-bit indices, not drawn" << std::endl;
    return false;
  }

  Mesh rl_mesh = {0};
  rl_mesh.vertexCount = static_cast<int>(mesh.vertices.size());
  rl_mesh.triangleCount = static_cast<int>(mesh.indices.size() / 3);
  rl_mesh.vertices = static_cast<float *>(MemAlloc(rl_mesh.vertexCount * 3 * sizeof(float)));
  rl_mesh.normals = static_cast<float *>(MemAlloc(rl_mesh.vertexCount * 3 * sizeof(float)));
  rl_mesh.indices = static_cast<unsigned short *>(
      MemAlloc(static_cast<unsigned int>(mesh.indices.size() * sizeof(unsigned short))));

  for (size_t i = 0; i < mesh.vertices.size(); ++i) {
    const terrain::Vertex &v = mesh.vertices[i];
    std::memcpy(&rl_mesh.vertices[i * 3], &v.position, 3 * sizeof(float));
    std::memcpy(&rl_mesh.normals[i * 3], &v.normal, 3 * sizeof(float));
  }
  for (size_t i = 0; i < mesh.indices.size(); ++i) {
    rl_mesh.indices[i] = static_cast<unsigned short>(mesh.indices[i]);
  }

  UploadMesh(&rl_mesh, false);

  std::string key = terrain::chunk_key(mesh.desc.corner_x, mesh.desc.corner_y);
  auto it = chunk_models_.find(key);
  if (it != chunk_models_.end()) {
    UnloadModel(it->second);
    chunk_models_.erase(it);
  }
  chunk_models_.emplace(key, LoadModelFromMesh(rl_mesh));
  return true;
}

void Renderer::clear_chunks() {
  for (auto &entry : chunk_models_) {
    UnloadModel(entry.second);
  }
  chunk_models_.clear();
}

void Renderer::begin_frame() {
  BeginDrawing();
  ClearBackground({18, 22, 28, 255});
  BeginMode3D(camera_);
}

void Renderer::draw_chunks() {
  for (const auto &entry : chunk_models_) {
    DrawModel(entry.second, {0.0f, 0.0f, 0.0f}, 1.0f, {96, 128, 80, 255});
    DrawModelWires(entry.second, {0.0f, 0.0f, 0.0f}, 1.0f, {40, 56, 36, 255});
  }
}

void Renderer::draw_hit(Vector3 point, Color color) {
  DrawSphere(point, 0.25f, color);
}

void Renderer::end_frame() {
  EndDrawing();
}

probe::CameraState Renderer::camera_state() const {
  float aspect = static_cast<float>(GetScreenWidth()) / static_cast<float>(GetScreenHeight());
  return probe::camera_state(camera_, aspect, config_.near_plane, config_.far_plane);
}

} // namespace renderer
} // namespace ridgeline
