#pragma once

#include <functional>

#include <opencv2/core.hpp>

#include "core/errors.hpp"
#include "platform/window.hpp"

namespace tbn {

// Rendering collaborator. Owned and used only by the presentation thread
class Renderer {
public:
  // Receives the surface to draw on and its size
  using DrawFn = std::function<void(cv::Mat& canvas, cv::Size size)>;

  virtual ~Renderer() = default;

  // Draws one frame and presents it to the window. Throws RendererError on failure
  virtual void draw(Window& window, const DrawFn& fn) = 0;
};

// Software renderer: an 8-bit BGR surface sized to the window, shown with Window::present
class MatRenderer final : public Renderer {
public:
  // Status codes carried by RendererError
  static constexpr int kSurfaceLost = -1;
  static constexpr int kBackendFailure = -2;

  MatRenderer() = default;

  void draw(Window& window, const DrawFn& fn) override;

private:
  cv::Mat surface_;
};

} // namespace tbn
