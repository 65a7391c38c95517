#include "apps/hud_overlay.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace tbn {

static constexpr auto kHudPeriod = std::chrono::milliseconds(250);

// green -> yellow -> red as a loop gets busier or a channel fills up
static cv::Scalar ColorByFrac(double frac) {
  if (frac > 0.85) return cv::Scalar(0, 0, 255);
  if (frac > 0.60) return cv::Scalar(0, 255, 255);
  return cv::Scalar(0, 255, 0);
}

static std::string Fixed1(double v) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << v;
  return oss.str();
}

double HudOverlay::NsToMs(std::uint64_t ns) {
  return static_cast<double>(ns) / 1e6;
}

std::string HudOverlay::Bar(std::size_t used, std::size_t cap, std::size_t width) {
  if (cap == 0) return std::string(width, '.');
  const double frac = std::min(1.0, static_cast<double>(used) / static_cast<double>(cap));
  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s(width, '.');
  std::fill(s.begin(), s.begin() + static_cast<std::ptrdiff_t>(filled), '#');
  return s;
}

void HudOverlay::rebuild(int type, const Metrics& metrics, const std::vector<QueueView>& queues) {
  const auto now_ns = NowNs();

  double dt = 0.0;
  if (last_tick_ns_ != 0) dt = static_cast<double>(now_ns - last_tick_ns_) / 1e9;
  last_tick_ns_ = now_ns;

  const int line = 15;
  const int panel_w = 320;
  const int panel_h = 22 + line * (static_cast<int>(metrics.stages().size()) +
                                   static_cast<int>(queues.size()) + 3);

  panel_.create(panel_h, panel_w, type);
  panel_.setTo(cv::Scalar(0, 0, 0));
  cv::rectangle(panel_, cv::Rect(0, 0, panel_w, panel_h), cv::Scalar(80, 80, 80), 1);

  auto put_at = [&](int x, int y, const std::string& s, const cv::Scalar& color = cv::Scalar(255, 255, 255)) {
    cv::putText(panel_, s, cv::Point(x, y), cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1, cv::LINE_AA);
  };
  auto rule = [&](int y) {
    cv::line(panel_, cv::Point(6, y), cv::Point(panel_w - 6, y), cv::Scalar(180, 180, 180), 1);
  };

  const int x0 = 6;
  const int x1 = 80;
  const int x2 = 140;
  const int x3 = 200;
  const int x4 = 260;

  int y = 18;
  put_at(x0, y, "LOOP");
  put_at(x1, y, "HZ");
  put_at(x2, y, "BUSY%");
  put_at(x3, y, "AVG(ms)");
  put_at(x4, y, "AGE(ms)");
  rule(y + 4);
  y += line;

  for (const auto& up : metrics.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto c = m.count.load(std::memory_order_relaxed);
    const double hz = (dt > 0.0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
    p.count = c;

    const auto work = m.work_ns_total.load(std::memory_order_relaxed);
    double busy = (dt > 0.0) ? (static_cast<double>(work - p.work_ns) / (dt * 1e9)) : 0.0;
    busy = std::max(0.0, std::min(1.0, busy));
    p.work_ns = work;

    const auto le = m.last_event_ns.load(std::memory_order_relaxed);
    const double age_ms = (le == 0 || le > now_ns) ? 0.0 : NsToMs(now_ns - le);

    put_at(x0, y, m.name);
    put_at(x1, y, Fixed1(hz));
    put_at(x2, y, Fixed1(busy * 100.0), ColorByFrac(busy));
    put_at(x3, y, Fixed1(NsToMs(m.avg_latency_ns.load(std::memory_order_relaxed))));
    put_at(x4, y, Fixed1(age_ms));
    y += line;
  }

  y += 12;
  put_at(x0, y, "CHANNEL");
  put_at(x1, y, "DEPTH");
  put_at(x2, y, "FILL");
  put_at(x4, y, "DROP/s");
  rule(y + 4);
  y += line;

  for (const auto& q : queues) {
    const auto used = q.size_fn ? q.size_fn() : 0;
    const auto cap = q.cap_fn ? q.cap_fn() : 0;
    const double frac = (cap == 0) ? 0.0 : static_cast<double>(used) / static_cast<double>(cap);
    const cv::Scalar qcolor = ColorByFrac(frac);

    const std::uint64_t total_drops = q.drops_fn ? q.drops_fn() : 0;
    std::uint64_t& prev_total = prev_qdrops_[q.name];
    const double drop_ps = (dt > 0.0) ? (static_cast<double>(total_drops - prev_total) / dt) : 0.0;
    prev_total = total_drops;

    std::ostringstream depth;
    depth << used << "/" << cap;

    put_at(x0, y, q.name);
    put_at(x1, y, depth.str(), qcolor);
    put_at(x2, y, "[" + Bar(used, cap, 10) + "]", qcolor);
    put_at(x4, y, Fixed1(drop_ps));
    y += line;
  }
}

// The panel is rebuilt every kHudPeriod and copied into the top-right corner of every frame in between
void HudOverlay::draw(cv::Mat& bgr, const Metrics& metrics, const std::vector<QueueView>& queues) {
  const auto now = std::chrono::steady_clock::now();

  const bool needs_refresh = panel_.empty() || panel_.type() != bgr.type() || (now - last_refresh_ >= kHudPeriod);
  if (needs_refresh) {
    rebuild(bgr.type(), metrics, queues);
    last_refresh_ = now;
  }

  const int margin = 6;
  const int w = std::min(panel_.cols, bgr.cols - 2 * margin);
  const int h = std::min(panel_.rows, bgr.rows - 2 * margin);
  if (w <= 0 || h <= 0) return;

  const int x = bgr.cols - w - margin;
  panel_(cv::Rect(0, 0, w, h)).copyTo(bgr(cv::Rect(x, margin, w, h)));
}

} // namespace tbn
