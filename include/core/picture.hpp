#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/font_set.hpp"

/*
    Frame descriptors.

    The game draws into a Canvas, which only records operations. PictureRecorder turns the recording into an
    immutable Picture that can be handed to the presentation thread and composited there with replay().
    Copies of a Picture share the same op list.
*/

namespace tbn {

struct Color {
  std::uint8_t a{255};
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  static constexpr Color FromArgb(std::uint8_t a, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return Color{a, r, g, b};
  }

  static constexpr Color FromRgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return Color{255, r, g, b};
  }

  // OpenCV images are BGR
  cv::Scalar to_scalar() const { return cv::Scalar(b, g, r); }
};

struct Paint {
  Color color{};
  int stroke_width{1};
  bool fill{true};
  bool anti_alias{false};

  Paint() = default;
  explicit Paint(Color c) : color(c) {}

  Paint& stroke(int width) {
    fill = false;
    stroke_width = width;
    return *this;
  }

  Paint& smooth() {
    anti_alias = true;
    return *this;
  }
};

struct DrawOp {
  enum class Kind : std::uint8_t { Clear, Rect, Line, Circle, Text };

  Kind kind{Kind::Clear};
  Paint paint{};

  cv::Rect2f rect{};     // Rect
  cv::Point2f p0{};      // Line start, Circle center, Text origin (baseline-left)
  cv::Point2f p1{};      // Line end
  float radius{0.f};     // Circle
  std::string text;      // Text
  FontFace font{};       // Text, resolved when recorded
};

class Picture {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  Picture() = default;

  const std::vector<DrawOp>& ops() const;
  bool empty() const { return !ops_ || ops_->empty(); }

  cv::Size bounds() const { return bounds_; }
  std::uint64_t sequence_id() const { return sequence_id_; }
  TimePoint recorded_at() const { return recorded_at_; }

  // Composites the recorded ops onto a BGR image. Ops falling outside the image are clipped
  void replay(cv::Mat& target) const;

private:
  friend class PictureRecorder;

  std::shared_ptr<const std::vector<DrawOp>> ops_;
  cv::Size bounds_{};
  std::uint64_t sequence_id_{0};
  TimePoint recorded_at_{};
};

// Recording surface handed to Game::draw. Coordinates are in window pixels, offset by translate()
class Canvas {
public:
  Canvas(cv::Size bounds, const FontSet* fonts);

  cv::Size size() const { return bounds_; }

  void clear(Color color);
  void draw_rect(const cv::Rect2f& rect, const Paint& paint);
  void draw_line(cv::Point2f from, cv::Point2f to, const Paint& paint);
  void draw_circle(cv::Point2f center, float radius, const Paint& paint);
  void draw_text(const std::string& text, cv::Point2f origin, const std::string& font, const Paint& paint);

  void translate(float dx, float dy);
  void save();
  void restore(); // No-op when nothing was saved

  std::size_t op_count() const { return ops_.size(); }

private:
  friend class PictureRecorder;

  cv::Point2f map(cv::Point2f p) const { return p + offset_; }

  cv::Size bounds_;
  const FontSet* fonts_;
  cv::Point2f offset_{};
  std::vector<cv::Point2f> saved_;
  std::vector<DrawOp> ops_;
};

class PictureRecorder {
public:
  PictureRecorder() = default;

  // Starts a fresh recording, dropping any unfinished one
  Canvas& begin_recording(cv::Size bounds, const FontSet* fonts);

  // Throws std::logic_error when no recording is in progress
  Picture finish_recording(std::uint64_t sequence_id = 0);

private:
  std::unique_ptr<Canvas> canvas_;
};

} // namespace tbn
