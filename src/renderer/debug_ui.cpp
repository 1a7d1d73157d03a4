/**
 * @file debug_ui.cpp
 * @brief ImGui sidebar implementation.
 */

#include <ridgeline/renderer/debug_ui.hpp>
#include <ridgeline/probe/intersect.hpp>

#include "imgui.h"
#include "rlImGui.h"
#include "raylib.h"

namespace ridgeline {
namespace renderer {

namespace {

void distance_row(const char *label, float value) {
  if (probe::is_hit(value)) {
    ImGui::Text("%s: %.3f", label, value);
  } else {
    ImGui::TextDisabled("%s: no hit", label);
  }
}

} // namespace

void DebugUI::init() {
  rlImGuiSetup(true);
  initialized_ = true;

  // Flat, compact theme
  ImGuiStyle &style = ImGui::GetStyle();
  style.WindowRounding = 0.0f;
  style.FrameRounding = 0.0f;
  style.GrabRounding = 0.0f;
  style.WindowPadding = ImVec2(8, 8);
  style.FramePadding = ImVec2(4, 2);
  style.ItemSpacing = ImVec2(6, 4);
  style.WindowBorderSize = 1.0f;

  ImVec4 *colors = style.Colors;
  colors[ImGuiCol_WindowBg] = ImVec4(0.05f, 0.06f, 0.07f, 0.95f);
  colors[ImGuiCol_Header] = ImVec4(0.10f, 0.22f, 0.16f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.14f, 0.32f, 0.22f, 1.00f);
  colors[ImGuiCol_HeaderActive] = ImVec4(0.18f, 0.40f, 0.28f, 1.00f);
  colors[ImGuiCol_Text] = ImVec4(0.82f, 0.86f, 0.78f, 1.00f);
}

void DebugUI::shutdown() {
  if (initialized_) {
    rlImGuiShutdown();
    initialized_ = false;
  }
}

void DebugUI::begin_frame() { rlImGuiBegin(); }
void DebugUI::end_frame() { rlImGuiEnd(); }

bool DebugUI::draw_sidebar(terrain::TerrainConfig &terrain_config,
                           probe::ProbeConfig &probe_config,
                           const ProbeReadout &readout,
                           bool gpu_terrain, size_t chunk_count) {
  bool regenerate = false;

  float sidebar_width = 260.0f;
  ImGui::SetNextWindowPos(ImVec2(0, 0), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(sidebar_width, static_cast<float>(GetScreenHeight())),
                           ImGuiCond_Always);

  ImGuiWindowFlags flags = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                           ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar;

  if (ImGui::Begin("##Sidebar", nullptr, flags)) {
    ImGui::Text("RIDGELINE");
    ImGui::SameLine(sidebar_width - 60);
    ImGui::TextDisabled("%d FPS", GetFPS());
    ImGui::Separator();

    // === TERRAIN ===
    if (ImGui::CollapsingHeader("Terrain", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("Backend: %s", gpu_terrain ? "GPU compute" : "CPU (OpenMP)");
      ImGui::Text("Chunks: %zu (%ux%u cells)", chunk_count,
                  terrain_config.chunk_size_x, terrain_config.chunk_size_y);
      ImGui::DragFloat2("Height", &terrain_config.min_max_height.x, 0.1f, -100.0f, 100.0f);
      if (ImGui::Button("Regenerate [R]")) {
        regenerate = true;
      }
    }

    // === PROBES ===
    if (ImGui::CollapsingHeader("Probes", ImGuiTreeNodeFlags_DefaultOpen)) {
      ImGui::Text("Backend: %s", readout.gpu ? "GPU compute" : "CPU (OpenMP)");
      distance_row("Ground", readout.ground_distance);
      distance_row("Cursor", readout.pick_distance);
      ImGui::Text("Plane probe: %.3f", readout.plane_value);

      bool scan_all = probe_config.scan_bound == probe::SCAN_ALL;
      if (ImGui::Checkbox("Scan full index buffer", &scan_all)) {
        probe_config.scan_bound = scan_all ? probe::SCAN_ALL : constants::LEGACY_SCAN_BOUND;
        add_log(GetTime(), scan_all ? "Mesh probe scans all indices"
                                    : "Mesh probe limited to 6144 indices");
      }

      int mode = probe_config.plane_mode == probe::PlaneProbeMode::CAMERA_HEIGHT ? 1 : 0;
      if (ImGui::Combo("Plane mode", &mode, "Constant\0Camera height\0")) {
        probe_config.plane_mode = mode == 1 ? probe::PlaneProbeMode::CAMERA_HEIGHT
                                            : probe::PlaneProbeMode::CONSTANT;
      }
    }

    // === EVENT LOG ===
    if (ImGui::CollapsingHeader("Event Log")) {
      if (ImGui::SmallButton("Clear")) {
        clear_log();
      }
      ImGui::SameLine();
      ImGui::Checkbox("Auto-scroll", &auto_scroll_log_);

      ImGui::BeginChild("##log", ImVec2(0, 200), true);
      for (const auto &entry : log_entries_) {
        ImVec4 color = ImVec4(0.75f, 0.75f, 0.75f, 1.0f);
        if (entry.severity == 1) color = ImVec4(1.0f, 0.8f, 0.2f, 1.0f);
        if (entry.severity == 2) color = ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        ImGui::TextColored(color, "[%.1f] %s", entry.time, entry.message.c_str());
      }
      if (auto_scroll_log_ && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
        ImGui::SetScrollHereY(1.0f);
      }
      ImGui::EndChild();
    }

    ImGui::Separator();
    ImGui::TextDisabled("RMB: look  WASD: move  R: regenerate");
  }
  ImGui::End();

  return regenerate;
}

void DebugUI::add_log(double time, const std::string &message, int severity) {
  log_entries_.push_back({time, message, severity});
  while (log_entries_.size() > MAX_LOG_ENTRIES) {
    log_entries_.pop_front();
  }
}

void DebugUI::clear_log() { log_entries_.clear(); }

bool DebugUI::is_capturing_mouse() const {
  return initialized_ && ImGui::GetIO().WantCaptureMouse;
}

} // namespace renderer
} // namespace ridgeline
