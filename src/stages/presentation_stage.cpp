#include "stages/presentation_stage.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace tbn {

const char* ToString(PresentationStopReason reason) {
  switch (reason) {
    case PresentationStopReason::Exit: return "exit";
    case PresentationStopReason::LogicGone: return "logic thread gone";
    case PresentationStopReason::RendererCrashed: return "renderer crashed";
  }
  return "unknown";
}

PresentationStage::PresentationStage(const RunnerConfig& cfg, Window& window, Renderer& renderer,
                                     Sender<Event>& events, LatestReceiver<Picture>& frames,
                                     Receiver<FeedbackEvent>& feedback, const Metrics* metrics,
                                     StageMetrics* present_metrics, std::vector<QueueView> queues)
    : cfg_(cfg),
      window_(window),
      renderer_(renderer),
      events_(events),
      frames_(frames),
      feedback_(feedback),
      metrics_(metrics),
      present_metrics_(present_metrics),
      queues_(std::move(queues)),
      background_(cfg.render.background.b, cfg.render.background.g, cfg.render.background.r) {
  if (cfg_.visualization.show_hud && metrics_) hud_ = std::make_unique<HudOverlay>();
}

PresentationStopReason PresentationStage::run(const StopToken& stop) {
  using Clock = std::chrono::steady_clock;

  const auto idle_sleep = std::chrono::milliseconds(cfg_.timing.idle_sleep_ms);
  std::vector<InputEvent> batch;
  bool close_forwarded = false;
  last_summary_ = Clock::now();

  for (;;) {
    const auto iteration_start = Clock::now();

    FeedbackEvent feedback;
    const PopStatus fs = feedback_.try_pop(feedback);
    if (fs == PopStatus::Ok) return finish(PresentationStopReason::Exit);
    if (fs == PopStatus::Closed) return finish(PresentationStopReason::LogicGone);

    batch.clear();
    window_.poll_events(batch);
    if (!close_forwarded && stop.stop_requested()) {
      batch.push_back(InputEvent::CloseRequested());
      close_forwarded = true;
    }
    for (const InputEvent& e : batch) {
      if (events_.push(Event::FromInput(e)) == PushStatus::Closed) return finish(PresentationStopReason::LogicGone);
    }

    Picture picture;
    const PopStatus ps = frames_.try_pop(picture);
    if (ps == PopStatus::Closed) return finish(PresentationStopReason::LogicGone);

    // Time spent pumping the window counts toward the idle quantum
    if (ps == PopStatus::Empty) {
      const auto spent = Clock::now() - iteration_start;
      if (spent < idle_sleep) std::this_thread::sleep_for(idle_sleep - spent);
      continue;
    }

    const auto t0 = Clock::now();
    try {
      present(picture);
    } catch (const RendererError& e) {
      std::cerr << "Renderer failure (code " << e.code() << "): " << e.what() << std::endl;
      if (events_.push(Event::FromCrash(e)) == PushStatus::Closed) {
        std::cerr << "Logic thread already gone, crash notification not delivered" << std::endl;
      }
      return finish(PresentationStopReason::RendererCrashed);
    }

    ++frames_presented_;
    if (present_metrics_) {
      const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count();
      present_metrics_->on_item(static_cast<std::uint64_t>(ns));
    }
    maybe_log_summary();
  }
}

PresentationStopReason PresentationStage::finish(PresentationStopReason reason) {
  std::cout << "presentation stopped (" << ToString(reason) << ") after " << frames_presented_ << " frames"
            << std::endl;
  return reason;
}

void PresentationStage::present(const Picture& picture) {
  renderer_.draw(window_, [&](cv::Mat& canvas, cv::Size) {
    canvas.setTo(background_);
    picture.replay(canvas);
    if (hud_) hud_->draw(canvas, *metrics_, queues_);
  });
}

void PresentationStage::maybe_log_summary() {
  if (!cfg_.metrics.enable_console_log || !metrics_) return;

  const auto now = std::chrono::steady_clock::now();
  const auto interval = std::chrono::milliseconds(cfg_.metrics.log_interval_ms);
  if (now - last_summary_ < interval) return;

  const double dt = std::chrono::duration<double>(now - last_summary_).count();
  last_summary_ = now;

  std::ostringstream line;
  line << std::fixed << std::setprecision(1);
  for (const auto& up : metrics_->stages()) {
    const auto c = up->count.load(std::memory_order_relaxed);
    std::uint64_t& prev = summary_counts_[up.get()];
    line << up->name << "=" << (static_cast<double>(c - prev) / dt) << "Hz ";
    prev = c;
  }
  for (const auto& q : queues_) {
    line << q.name << "=" << (q.size_fn ? q.size_fn() : 0) << "/" << (q.cap_fn ? q.cap_fn() : 0)
         << " drops=" << (q.drops_fn ? q.drops_fn() : 0) << " ";
  }
  std::cout << line.str() << std::endl;
}

} // namespace tbn
