#include "core/picture.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace tbn {

static const std::vector<DrawOp> kNoOps;

const std::vector<DrawOp>& Picture::ops() const {
  return ops_ ? *ops_ : kNoOps;
}

static int LineType(const Paint& paint) {
  return paint.anti_alias ? cv::LINE_AA : cv::LINE_8;
}

static int Thickness(const Paint& paint) {
  return paint.fill ? cv::FILLED : std::max(1, paint.stroke_width);
}

static cv::Point ToPixel(cv::Point2f p) {
  return cv::Point(cvRound(p.x), cvRound(p.y));
}

// Draws one op directly, or blended through a copy when the paint is translucent
template <typename Fn>
static void DrawBlended(cv::Mat& target, const Color& color, Fn&& draw) {
  if (color.a == 255) {
    draw(target);
    return;
  }
  if (color.a == 0) return;

  cv::Mat layer = target.clone();
  draw(layer);
  const double alpha = color.a / 255.0;
  cv::addWeighted(layer, alpha, target, 1.0 - alpha, 0.0, target);
}

void Picture::replay(cv::Mat& target) const {
  if (target.empty()) return;

  for (const DrawOp& op : ops()) {
    const cv::Scalar color = op.paint.color.to_scalar();

    switch (op.kind) {
      case DrawOp::Kind::Clear:
        DrawBlended(target, op.paint.color, [&](cv::Mat& m) { m.setTo(color); });
        break;

      case DrawOp::Kind::Rect: {
        const cv::Rect r(ToPixel(op.rect.tl()), ToPixel(op.rect.br()));
        DrawBlended(target, op.paint.color, [&](cv::Mat& m) {
          cv::rectangle(m, r, color, Thickness(op.paint), LineType(op.paint));
        });
        break;
      }

      case DrawOp::Kind::Line:
        DrawBlended(target, op.paint.color, [&](cv::Mat& m) {
          cv::line(m, ToPixel(op.p0), ToPixel(op.p1), color, std::max(1, op.paint.stroke_width), LineType(op.paint));
        });
        break;

      case DrawOp::Kind::Circle:
        DrawBlended(target, op.paint.color, [&](cv::Mat& m) {
          cv::circle(m, ToPixel(op.p0), cvRound(op.radius), color, Thickness(op.paint), LineType(op.paint));
        });
        break;

      case DrawOp::Kind::Text:
        DrawBlended(target, op.paint.color, [&](cv::Mat& m) {
          cv::putText(m, op.text, ToPixel(op.p0), op.font.face, op.font.scale, color,
                      std::max(1, op.paint.stroke_width), LineType(op.paint));
        });
        break;
    }
  }
}

Canvas::Canvas(cv::Size bounds, const FontSet* fonts) : bounds_(bounds), fonts_(fonts) {}

void Canvas::clear(Color color) {
  DrawOp op;
  op.kind = DrawOp::Kind::Clear;
  op.paint = Paint(color);
  ops_.push_back(std::move(op));
}

void Canvas::draw_rect(const cv::Rect2f& rect, const Paint& paint) {
  DrawOp op;
  op.kind = DrawOp::Kind::Rect;
  op.paint = paint;
  op.rect = cv::Rect2f(map(rect.tl()), rect.size());
  ops_.push_back(std::move(op));
}

void Canvas::draw_line(cv::Point2f from, cv::Point2f to, const Paint& paint) {
  DrawOp op;
  op.kind = DrawOp::Kind::Line;
  op.paint = paint;
  op.p0 = map(from);
  op.p1 = map(to);
  ops_.push_back(std::move(op));
}

void Canvas::draw_circle(cv::Point2f center, float radius, const Paint& paint) {
  DrawOp op;
  op.kind = DrawOp::Kind::Circle;
  op.paint = paint;
  op.p0 = map(center);
  op.radius = radius;
  ops_.push_back(std::move(op));
}

void Canvas::draw_text(const std::string& text, cv::Point2f origin, const std::string& font, const Paint& paint) {
  DrawOp op;
  op.kind = DrawOp::Kind::Text;
  op.paint = paint;
  op.p0 = map(origin);
  op.text = text;
  if (fonts_) op.font = fonts_->lookup(font);
  ops_.push_back(std::move(op));
}

void Canvas::translate(float dx, float dy) {
  offset_ += cv::Point2f(dx, dy);
}

void Canvas::save() {
  saved_.push_back(offset_);
}

void Canvas::restore() {
  if (saved_.empty()) return;
  offset_ = saved_.back();
  saved_.pop_back();
}

Canvas& PictureRecorder::begin_recording(cv::Size bounds, const FontSet* fonts) {
  canvas_ = std::make_unique<Canvas>(bounds, fonts);
  return *canvas_;
}

Picture PictureRecorder::finish_recording(std::uint64_t sequence_id) {
  if (!canvas_) throw std::logic_error("finish_recording called without begin_recording");

  Picture pic;
  pic.ops_ = std::make_shared<const std::vector<DrawOp>>(std::move(canvas_->ops_));
  pic.bounds_ = canvas_->bounds_;
  pic.sequence_id_ = sequence_id;
  pic.recorded_at_ = std::chrono::steady_clock::now();

  canvas_.reset();
  return pic;
}

} // namespace tbn
