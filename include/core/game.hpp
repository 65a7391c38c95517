#pragma once

#include <functional>
#include <memory>

#include <opencv2/core.hpp>

#include "core/errors.hpp"
#include "core/input_event.hpp"
#include "core/picture.hpp"
#include "core/sim_context.hpp"

namespace tbn {

/*
    The simulation driven by the runner. Every hook runs on the logic thread.

    Exceptions thrown from a hook are not caught by the runner: they end the logic thread and with it the process.
*/
class Game {
public:
  virtual ~Game() = default;

  // Called once per logic loop iteration, at the update cadence
  virtual void update(SimContext& ctx) = 0;

  // Called at the frame cadence. Must only record into the canvas, not change simulation state
  virtual void draw(Canvas& canvas, const SimContext& ctx) = 0;

  virtual void input(const InputEvent& event, SimContext& ctx) {
    (void)event;
    (void)ctx;
  }

  // Also called once right after construction with the initial window size
  virtual void set_size(cv::Size size) { (void)size; }

  // Called exactly once before a graceful shutdown
  virtual void close() {}

  // Called exactly once, instead of close(), when the renderer failed
  virtual void crash(const RendererError& error) { (void)error; }
};

// Builds the game on the logic thread, after the context exists
using GameFactory = std::function<std::unique_ptr<Game>(SimContext&)>;

} // namespace tbn
