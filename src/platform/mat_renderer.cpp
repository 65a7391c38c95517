#include "platform/renderer.hpp"

#include <string>

namespace tbn {

void MatRenderer::draw(Window& window, const DrawFn& fn) {
  const cv::Size size = window.size();
  if (size.width <= 0 || size.height <= 0) {
    throw RendererError(kSurfaceLost, "Surface lost: window size is " + std::to_string(size.width) + "x" +
                                          std::to_string(size.height));
  }

  try {
    // Reuses the previous allocation when the size did not change
    surface_.create(size, CV_8UC3);
    fn(surface_, size);
    window.present(surface_);
  } catch (const cv::Exception& e) {
    throw RendererError(kBackendFailure, std::string("OpenCV failure while presenting: ") + e.what());
  }
}

} // namespace tbn
