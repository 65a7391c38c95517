#include "platform/highgui_window.hpp"

#include <iostream>
#include <stdexcept>

#include <opencv2/highgui.hpp>

namespace tbn {

HighGuiWindow::HighGuiWindow(const WindowConfig& cfg) : name_(cfg.title), size_(cfg.width, cfg.height) {
  const int flags = cfg.resizable ? (cv::WINDOW_NORMAL | cv::WINDOW_KEEPRATIO) : cv::WINDOW_AUTOSIZE;

  try {
    cv::namedWindow(name_, flags);
    if (cfg.resizable) cv::resizeWindow(name_, size_);
    cv::setMouseCallback(name_, &HighGuiWindow::OnMouse, this);
  } catch (const cv::Exception& e) {
    throw std::runtime_error("Failed to create window '" + name_ + "': " + e.what());
  }
}

HighGuiWindow::~HighGuiWindow() {
  if (closed_) return;
  try {
    cv::destroyWindow(name_);
  } catch (const cv::Exception& e) {
    std::cerr << "Failed to destroy window '" << name_ << "': " << e.what() << std::endl;
  }
}

void HighGuiWindow::OnMouse(int event, int x, int y, int flags, void* userdata) {
  static_cast<HighGuiWindow*>(userdata)->on_mouse(event, x, y, flags);
}

void HighGuiWindow::on_mouse(int event, int x, int y, int flags) {
  const cv::Point2f p(static_cast<float>(x), static_cast<float>(y));

  switch (event) {
    case cv::EVENT_MOUSEMOVE:
      pending_.push_back(InputEvent::PointerMoved(p));
      break;
    case cv::EVENT_LBUTTONDOWN:
      pending_.push_back(InputEvent::Button(MouseButton::Left, true, p));
      break;
    case cv::EVENT_LBUTTONUP:
      pending_.push_back(InputEvent::Button(MouseButton::Left, false, p));
      break;
    case cv::EVENT_RBUTTONDOWN:
      pending_.push_back(InputEvent::Button(MouseButton::Right, true, p));
      break;
    case cv::EVENT_RBUTTONUP:
      pending_.push_back(InputEvent::Button(MouseButton::Right, false, p));
      break;
    case cv::EVENT_MBUTTONDOWN:
      pending_.push_back(InputEvent::Button(MouseButton::Middle, true, p));
      break;
    case cv::EVENT_MBUTTONUP:
      pending_.push_back(InputEvent::Button(MouseButton::Middle, false, p));
      break;
    case cv::EVENT_MOUSEWHEEL:
      pending_.push_back(InputEvent::Scrolled(cv::getMouseWheelDelta(flags) > 0 ? 1.f : -1.f, p));
      break;
    default:
      break;
  }
}

void HighGuiWindow::AppendKeyTap(int key, std::vector<InputEvent>& out) {
  out.push_back(InputEvent::Key(key, true));
  out.push_back(InputEvent::Key(key, false));
}

void HighGuiWindow::poll_events(std::vector<InputEvent>& out) {
  if (closed_) return;

  // waitKeyEx pumps the window system, which is what fires OnMouse. Its 1 ms wait is part of the caller's idle time
  const int key = cv::waitKeyEx(1);

  out.insert(out.end(), pending_.begin(), pending_.end());
  pending_.clear();

  if (key >= 0) AppendKeyTap(key, out);

  // The user closed the window through the window manager
  if (cv::getWindowProperty(name_, cv::WND_PROP_VISIBLE) < 1.0) {
    closed_ = true;
    out.push_back(InputEvent::CloseRequested());
    return;
  }

  const cv::Rect r = cv::getWindowImageRect(name_);
  if (r.width > 0 && r.height > 0 && r.size() != size_) {
    size_ = r.size();
    out.push_back(InputEvent::Resized(size_));
  }
}

void HighGuiWindow::present(const cv::Mat& image) {
  if (closed_) return;
  cv::imshow(name_, image);
}

// highgui has no cursor control. The request is remembered and reported once
void HighGuiWindow::set_cursor_visible(bool visible) {
  if (visible == cursor_visible_) return;
  cursor_visible_ = visible;
  std::cout << "Window '" << name_ << "': cursor visibility is not controllable with highgui, requested "
            << (visible ? "visible" : "hidden") << std::endl;
}

} // namespace tbn
