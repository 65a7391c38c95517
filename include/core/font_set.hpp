#pragma once

#include <string>
#include <unordered_map>

namespace tbn {

// A font as OpenCV draws it: a Hershey face id plus the scale that maps it to roughly 16px text
struct FontFace {
  int face{0};
  double scale{0.5};
};

class FontSet {
public:
  virtual ~FontSet() = default;

  // Unknown names resolve to the set's default face
  virtual FontFace lookup(const std::string& name) const = 0;
};

// Registers "default", "mono", "serif" and "script"
class DefaultFontSet final : public FontSet {
public:
  DefaultFontSet();

  FontFace lookup(const std::string& name) const override;

private:
  std::unordered_map<std::string, FontFace> faces_;
  FontFace fallback_{};
};

} // namespace tbn
