#pragma once
#include <cstddef>
#include <string>

namespace tbn {

struct WindowConfig {
  std::string title = "Tachibana";
  std::string app_name = "Tachibana";

  int width = 1280;
  int height = 720;

  bool resizable = true;
  bool hide_cursor = true;
};

// Cadences of the two runner loops. Update may run faster than draw, never the other way around
struct TimingConfig {
  int update_interval_ms = 1;   // 1000 updates/s
  int frame_interval_ms = 8;    // 120 frames/s cap
  int idle_sleep_ms = 1;        // presentation back-off when no frame is ready
};

// Frame and feedback channels always hold exactly one item, only the event channel is tunable
struct ChannelsConfig {
  std::size_t event_capacity = 8;
};

struct RgbColor {
  int r = 10;
  int g = 10;
  int b = 10;
};

struct RenderConfig {
  RgbColor background{};
};

struct AudioConfig {
  bool enabled = true;
  std::string backend = "null"; // null (others are provided by the embedding application)
};

struct VisualizationConfig {
  bool show_hud = false;
};

struct MetricsConfig {
  bool enable_console_log = false;
  int log_interval_ms = 1000;
};

struct RunnerConfig {
  WindowConfig window{};
  TimingConfig timing{};
  ChannelsConfig channels{};
  RenderConfig render{};
  AudioConfig audio{};
  VisualizationConfig visualization{};
  MetricsConfig metrics{};
};

}
