#pragma once

/**
 * @file debug_ui.hpp
 * @brief ImGui sidebar for the terrain viewer.
 *
 * Provides a left-side panel with:
 * - Backend status (GPU kernels or CPU fallback)
 * - Terrain parameters and regeneration
 * - Probe readouts
 * - Event log
 */

#include <deque>
#include <string>

#include <ridgeline/probe/mesh_probe.hpp>
#include <ridgeline/terrain/chunk.hpp>

namespace ridgeline {
namespace renderer {

/**
 * @brief Log entry for the event log.
 */
struct LogEntry {
  double time;
  std::string message;
  int severity; // 0=info, 1=warning, 2=error
};

/**
 * @brief Per-frame probe values shown in the sidebar.
 */
struct ProbeReadout {
  float ground_distance;   // Downward probe from the camera
  float pick_distance;     // Cursor pick ray
  float plane_value;       // Plane placeholder probe
  bool gpu;                // Which backend produced them
};

/**
 * @brief Viewer sidebar.
 */
class DebugUI {
public:
  DebugUI() = default;
  ~DebugUI() = default;

  // Lifecycle
  void init();
  void shutdown();

  // Frame management
  void begin_frame();
  void end_frame();

  /**
   * @brief Draw the sidebar. Edits config in place.
   * @return true if the user asked to regenerate chunks
   */
  bool draw_sidebar(terrain::TerrainConfig &terrain_config,
                    probe::ProbeConfig &probe_config,
                    const ProbeReadout &readout,
                    bool gpu_terrain, size_t chunk_count);

  // Logging
  void add_log(double time, const std::string &message, int severity = 0);
  void clear_log();

  bool is_capturing_mouse() const;

private:
  bool initialized_ = false;

  // Log storage
  std::deque<LogEntry> log_entries_;
  static constexpr size_t MAX_LOG_ENTRIES = 200;
  bool auto_scroll_log_ = true;
};

} // namespace renderer
} // namespace ridgeline
