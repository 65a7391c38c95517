#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include <opencv2/core.hpp>

#include "core/font_set.hpp"
#include "core/input_state.hpp"
#include "core/time_state.hpp"

/*
    SimContext is the simulation state owned by the logic thread: input snapshot, the update and draw timing
    trackers, the font registry, and the id counter.

    It is created on the logic thread and passed by reference into every Game hook. It remembers the thread that
    created it and every accessor throws std::logic_error when called from any other thread, so a context that
    leaks to the presentation thread fails immediately instead of racing.
*/

namespace tbn {

struct Id {
  std::uint64_t value{0};

  bool operator==(const Id& other) const { return value == other.value; }
  bool operator!=(const Id& other) const { return value != other.value; }
  bool operator<(const Id& other) const { return value < other.value; }
};

class SimContext {
public:
  using Duration = TimeState::Duration;

  // Throws std::invalid_argument for a null font set or a non-positive window size
  SimContext(cv::Size window_size, std::unique_ptr<FontSet> fonts);

  SimContext(const SimContext&) = delete;
  SimContext& operator=(const SimContext&) = delete;

  // Read-only snapshot queries
  Duration update_delta() const;
  Duration update_elapsed() const;
  Duration draw_delta() const;
  Duration draw_elapsed() const;
  cv::Point2f pointer_position() const;
  cv::Size window_size() const;
  const FontSet& fonts() const;

  const InputState& input() const;
  const TimeState& update_time() const;
  const TimeState& draw_time() const;

  // Mutable entry points, used by the logic loop
  InputState& input();
  TimeState& update_time();
  TimeState& draw_time();

  // Unique within this context, starting at 0
  Id next_id();

  std::thread::id owner() const { return owner_; }

private:
  void EnsureOwner() const;

  std::thread::id owner_;
  InputState input_state_;
  TimeState time_state_;
  TimeState time_state_draw_;
  std::unique_ptr<FontSet> font_set_;
  std::uint64_t id_keeper_{0};
};

} // namespace tbn
