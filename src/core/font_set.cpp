#include "core/font_set.hpp"

#include <opencv2/imgproc.hpp>

namespace tbn {

DefaultFontSet::DefaultFontSet() {
  fallback_ = FontFace{cv::FONT_HERSHEY_SIMPLEX, 0.5};

  faces_["default"] = fallback_;
  faces_["mono"] = FontFace{cv::FONT_HERSHEY_PLAIN, 1.0};
  faces_["serif"] = FontFace{cv::FONT_HERSHEY_TRIPLEX, 0.5};
  faces_["script"] = FontFace{cv::FONT_HERSHEY_SCRIPT_SIMPLEX, 0.6};
}

FontFace DefaultFontSet::lookup(const std::string& name) const {
  const auto it = faces_.find(name);
  return it == faces_.end() ? fallback_ : it->second;
}

} // namespace tbn
