#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace tbn {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

// Colors are written as [r, g, b]
static RgbColor ParseColorKey(const YAML::Node& parent, const char* key, const std::string& key_path, const RgbColor& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  if (!n.IsSequence() || n.size() != 3) throw ConfigError(key_path, "expected [r, g, b]");

  RgbColor c;
  try {
    c.r = n[0].as<int>();
    c.g = n[1].as<int>();
    c.b = n[2].as<int>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
  return c;
}

static void LoadWindow(const YAML::Node& root, WindowConfig& cfg) {
  const YAML::Node win = root["window"];
  if (!win) return;
  const std::string p = "window";

  cfg.title = GetOrKey<std::string>(win, "title", PathJoin(p, "title"), cfg.title);
  cfg.app_name = GetOrKey<std::string>(win, "app_name", PathJoin(p, "app_name"), cfg.app_name);
  cfg.width = GetOrKey<int>(win, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(win, "height", PathJoin(p, "height"), cfg.height);
  cfg.resizable = GetOrKey<bool>(win, "resizable", PathJoin(p, "resizable"), cfg.resizable);
  cfg.hide_cursor = GetOrKey<bool>(win, "hide_cursor", PathJoin(p, "hide_cursor"), cfg.hide_cursor);
}

static void LoadTiming(const YAML::Node& root, TimingConfig& cfg) {
  const YAML::Node t = root["timing"];
  if (!t) return;
  const std::string p = "timing";

  cfg.update_interval_ms = GetOrKey<int>(t, "update_interval_ms", PathJoin(p, "update_interval_ms"), cfg.update_interval_ms);
  cfg.frame_interval_ms = GetOrKey<int>(t, "frame_interval_ms", PathJoin(p, "frame_interval_ms"), cfg.frame_interval_ms);
  cfg.idle_sleep_ms = GetOrKey<int>(t, "idle_sleep_ms", PathJoin(p, "idle_sleep_ms"), cfg.idle_sleep_ms);
}

static void LoadChannels(const YAML::Node& root, ChannelsConfig& cfg) {
  const YAML::Node ch = root["channels"];
  if (!ch) return;
  const std::string p = "channels";

  cfg.event_capacity = GetOrKey<std::size_t>(ch, "event_capacity", PathJoin(p, "event_capacity"), cfg.event_capacity);

  if (Child(ch, "frame_capacity") || Child(ch, "feedback_capacity")) {
    throw ConfigError(p, "frame_capacity/feedback_capacity are fixed at 1 and cannot be configured");
  }
}

static void LoadRender(const YAML::Node& root, RenderConfig& cfg) {
  const YAML::Node r = root["render"];
  if (!r) return;
  cfg.background = ParseColorKey(r, "background", "render.background", cfg.background);
}

static void LoadAudio(const YAML::Node& root, AudioConfig& cfg) {
  const YAML::Node a = root["audio"];
  if (!a) return;
  const std::string p = "audio";

  cfg.enabled = GetOrKey<bool>(a, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.backend = GetOrKey<std::string>(a, "backend", PathJoin(p, "backend"), cfg.backend);
}

static void LoadVisualization(const YAML::Node& root, VisualizationConfig& cfg) {
  const YAML::Node viz = root["visualization"];
  if (!viz) return;
  cfg.show_hud = GetOrKey<bool>(viz, "show_hud", "visualization.show_hud", cfg.show_hud);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
}

static bool InByteRange(int v) { return v >= 0 && v <= 255; }

void ValidateOrThrow(const RunnerConfig& cfg) {
  if (cfg.window.width <= 0 || cfg.window.height <= 0) throw ConfigError("window", "width/height must be > 0");
  if (cfg.window.title.empty()) throw ConfigError("window.title", "must not be empty");

  if (cfg.timing.update_interval_ms <= 0) throw ConfigError("timing.update_interval_ms", "must be > 0");
  if (cfg.timing.frame_interval_ms <= 0) throw ConfigError("timing.frame_interval_ms", "must be > 0");
  if (cfg.timing.update_interval_ms > cfg.timing.frame_interval_ms)
    throw ConfigError("timing.update_interval_ms", "must be <= timing.frame_interval_ms");
  if (cfg.timing.idle_sleep_ms <= 0) throw ConfigError("timing.idle_sleep_ms", "must be > 0");

  if (cfg.channels.event_capacity < 1) throw ConfigError("channels.event_capacity", "must be >= 1");

  const auto& bg = cfg.render.background;
  if (!InByteRange(bg.r) || !InByteRange(bg.g) || !InByteRange(bg.b))
    throw ConfigError("render.background", "components must be in [0, 255]");

  if (cfg.audio.enabled && cfg.audio.backend != "null")
    throw ConfigError("audio.backend", "unknown backend '" + cfg.audio.backend + "'. Use: null");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
}

static RunnerConfig LoadFromRoot(const YAML::Node& root) {
  RunnerConfig cfg;

  LoadWindow(root, cfg.window);
  LoadTiming(root, cfg.timing);
  LoadChannels(root, cfg.channels);
  LoadRender(root, cfg.render);
  LoadAudio(root, cfg.audio);
  LoadVisualization(root, cfg.visualization);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

RunnerConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

RunnerConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace tbn
