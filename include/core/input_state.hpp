#pragma once

#include <optional>
#include <set>

#include <opencv2/core.hpp>

#include "core/input_event.hpp"

namespace tbn {

// What the logic thread should do with an input event after InputState has absorbed it
struct EventHandleResult {
  enum class Kind {
    Input,    // forward to Game::input
    Resized,  // forward to Game::set_size
    Exit      // run Game::close and shut the runner down
  };

  Kind kind{Kind::Input};
  InputEvent event{};
  cv::Size size{};
};

// Snapshot of the pointer, window size, and held keys/buttons as seen by the logic thread
class InputState {
public:
  explicit InputState(cv::Size window_size);

  // Updates the snapshot. Returns nothing for events that carry no new information
  // (a resize to the current size, a release of something that is not held)
  std::optional<EventHandleResult> handle_event(const InputEvent& event);

  cv::Point2f mouse_position() const { return mouse_position_; }
  cv::Size window_size() const { return window_size_; }

  // Between a KeyPressed and its KeyReleased. Backends that only see typed keys send both back to back
  bool is_key_down(int key) const { return keys_down_.count(key) != 0; }
  bool is_button_down(MouseButton b) const { return buttons_down_.count(b) != 0; }

private:
  cv::Point2f mouse_position_{};
  cv::Size window_size_{};
  std::set<int> keys_down_;
  std::set<MouseButton> buttons_down_;
};

} // namespace tbn
