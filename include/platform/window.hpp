#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/input_event.hpp"

namespace tbn {

// Window collaborator. Owned and used only by the presentation (primary) thread
class Window {
public:
  virtual ~Window() = default;

  // Current drawable size in pixels
  virtual cv::Size size() const = 0;

  // Appends the finite batch of events that arrived since the last poll
  virtual void poll_events(std::vector<InputEvent>& out) = 0;

  // Shows a finished BGR image
  virtual void present(const cv::Mat& image) = 0;

  virtual void set_cursor_visible(bool visible) = 0;
};

} // namespace tbn
