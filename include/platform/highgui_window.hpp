#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "platform/window.hpp"

namespace tbn {

/*
    Window backed by OpenCV highgui.

    highgui delivers mouse callbacks from inside waitKey on the thread that pumps it, so events are buffered in
    pending_ and handed out by poll_events. highgui reports a key only once, when it is typed, so each key is
    delivered as a press immediately followed by its release.
*/
class HighGuiWindow final : public Window {
public:
  // Throws std::runtime_error if the window cannot be created
  explicit HighGuiWindow(const WindowConfig& cfg);
  ~HighGuiWindow() override;

  HighGuiWindow(const HighGuiWindow&) = delete;
  HighGuiWindow& operator=(const HighGuiWindow&) = delete;

  cv::Size size() const override { return size_; }
  void poll_events(std::vector<InputEvent>& out) override;
  void present(const cv::Mat& image) override;
  void set_cursor_visible(bool visible) override;

  const std::string& name() const { return name_; }

  // The events one typed key turns into
  static void AppendKeyTap(int key, std::vector<InputEvent>& out);

private:
  static void OnMouse(int event, int x, int y, int flags, void* userdata);
  void on_mouse(int event, int x, int y, int flags);

  std::string name_;
  cv::Size size_;
  bool closed_{false};
  bool cursor_visible_{true};
  std::vector<InputEvent> pending_;
};

} // namespace tbn
