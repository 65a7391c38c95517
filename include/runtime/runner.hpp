#pragma once

#include <cstddef>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/game.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "platform/audio.hpp"
#include "platform/renderer.hpp"
#include "platform/window.hpp"
#include "stages/presentation_stage.hpp"

namespace tbn {

/*
    Runner wires the two threads together.

    The calling thread becomes the presentation thread; a LogicStage is spawned for the game. Three channels
    connect them: events (presentation -> logic, lossless, cfg.channels.event_capacity), frames (logic ->
    presentation, single latest-wins slot) and feedback (logic -> presentation, one Exit).

    run() returns once both loops have ended. The collaborators are borrowed and must outlive run().
*/
class Runner {
public:
  static constexpr std::size_t kFrameQueueLength = 1;
  static constexpr std::size_t kFeedbackQueueSize = 1;

  Runner(RunnerConfig cfg, Window& window, Renderer& renderer, AudioSystem& audio);

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  PresentationStopReason run(GameFactory factory, StopToken stop = StopToken());

  const Metrics& metrics() const { return metrics_; }
  const RunnerConfig& config() const { return cfg_; }

private:
  RunnerConfig cfg_;
  Window& window_;
  Renderer& renderer_;
  AudioSystem& audio_;

  Metrics metrics_;
  StageMetrics* update_metrics_;
  StageMetrics* draw_metrics_;
  StageMetrics* present_metrics_;
};

// Desktop entry point: opens a highgui window, builds the audio backend from the config, and runs
class Builder {
public:
  Builder() = default;

  Builder& config(RunnerConfig cfg);
  Builder& inner_size(cv::Size size);
  Builder& window_title(std::string title);
  Builder& app_name(std::string name);
  Builder& stop_token(StopToken stop);

  // Validates the config first. Throws std::runtime_error on invalid config or failed window creation
  PresentationStopReason run(GameFactory factory);

private:
  RunnerConfig cfg_{};
  StopToken stop_{};
};

} // namespace tbn
