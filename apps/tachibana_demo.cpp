#include <iostream>

#include <chrono>
#include <cmath>
#include <csignal>
#include <memory>
#include <sstream>

#include "core/config_loader.hpp"
#include "core/game.hpp"
#include "infra/stop_token.hpp"
#include "runtime/runner.hpp"

// tachibana_demo.cpp is the bring-up scene for the runner
// Panels, a translated box, a spinning throbber and a software cursor, all driven from the logic thread

namespace {

tbn::StopSource g_stop;

void HandleSigint(int) {
  g_stop.request_stop();
}

class DemoGame final : public tbn::Game {
public:
  explicit DemoGame(tbn::SimContext& ctx) : id_(ctx.next_id()) {}

  void update(tbn::SimContext& ctx) override {
    const double dt = std::chrono::duration<double>(ctx.update_delta()).count();
    angle_ += dt * 3.0;
    if (angle_ > 2.0 * CV_PI) angle_ -= 2.0 * CV_PI;
  }

  void draw(tbn::Canvas& canvas, const tbn::SimContext& ctx) override {
    const float w = static_cast<float>(size_.width);
    const float h = static_cast<float>(size_.height);

    // Two stacked panels filling the window, the lower one three times taller
    canvas.draw_rect(cv::Rect2f(0.f, 0.f, w, h * 0.25f), tbn::Paint(tbn::Color::FromArgb(77, 51, 204, 0)));
    canvas.draw_rect(cv::Rect2f(0.f, h * 0.25f, w, h * 0.75f),
                     tbn::Paint(tbn::Color::FromArgb(77, 178, 26, 51)).smooth());

    canvas.save();
    canvas.translate(20.f, 20.f);
    canvas.draw_rect(cv::Rect2f(0.f, 0.f, 50.f, 100.f), tbn::Paint(tbn::Color::FromRgb(0, 0, 255)).smooth());
    canvas.restore();

    // Throbber
    const cv::Point2f center(w * 0.5f, h * 0.5f);
    const float radius = 50.f;
    for (int i = 0; i < 8; ++i) {
      const double a = angle_ + i * (CV_PI / 16.0);
      const cv::Point2f p(center.x + radius * static_cast<float>(std::cos(a)),
                          center.y + radius * static_cast<float>(std::sin(a)));
      canvas.draw_circle(p, 6.f, tbn::Paint(tbn::Color::FromRgb(0, 255, 0)).smooth());
    }

    std::ostringstream stats;
    stats << "id " << id_.value << "  update " << std::chrono::duration_cast<std::chrono::microseconds>(ctx.update_delta()).count()
          << "us  frame " << std::chrono::duration_cast<std::chrono::milliseconds>(ctx.draw_delta()).count() << "ms"
          << "  clicks " << clicks_;
    canvas.draw_text(stats.str(), cv::Point2f(10.f, h - 12.f), "mono", tbn::Paint(tbn::Color::FromRgb(230, 230, 230)));

    // The system cursor is hidden, draw our own
    const cv::Point2f p = ctx.pointer_position();
    tbn::Paint cursor(tbn::Color::FromRgb(255, 255, 255));
    cursor.stroke(1);
    canvas.draw_line(p - cv::Point2f(8.f, 0.f), p + cv::Point2f(8.f, 0.f), cursor);
    canvas.draw_line(p - cv::Point2f(0.f, 8.f), p + cv::Point2f(0.f, 8.f), cursor);
  }

  void input(const tbn::InputEvent& event, tbn::SimContext&) override {
    if (event.type == tbn::InputEvent::Type::ButtonPressed) ++clicks_;
  }

  void set_size(cv::Size size) override { size_ = size; }

  void close() override {
    std::cout << "demo closed after " << clicks_ << " clicks" << std::endl;
  }

  void crash(const tbn::RendererError& error) override {
    std::cerr << "demo crashed: " << error.what() << std::endl;
  }

private:
  tbn::Id id_;
  cv::Size size_{};
  double angle_{0.0};
  int clicks_{0};
};

} // namespace

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    tbn::RunnerConfig cfg = tbn::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);

    const tbn::PresentationStopReason reason =
        tbn::Builder()
            .config(cfg)
            .stop_token(g_stop.token())
            .run([](tbn::SimContext& ctx) { return std::make_unique<DemoGame>(ctx); });

    if (reason == tbn::PresentationStopReason::RendererCrashed) return 2;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
