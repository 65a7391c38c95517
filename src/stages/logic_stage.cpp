#include "stages/logic_stage.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/errors.hpp"

namespace tbn {

using Clock = std::chrono::steady_clock;

static void Report(StageMetrics* m, Clock::time_point t0) {
  if (!m) return;
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count();
  m->on_item(static_cast<std::uint64_t>(ns));
}

LogicStage::LogicStage(TimingConfig timing, cv::Size initial_size, GameFactory factory, AudioSystem& audio,
                       Receiver<Event> events, LatestSender<Picture> frames, Sender<FeedbackEvent> feedback,
                       StageMetrics* update_metrics, StageMetrics* draw_metrics)
    : Stage("logic"),
      timing_(timing),
      initial_size_(initial_size),
      factory_(std::move(factory)),
      audio_(audio),
      events_(std::move(events)),
      frames_(std::move(frames)),
      feedback_(std::move(feedback)),
      update_metrics_(update_metrics),
      draw_metrics_(draw_metrics) {}

LogicStage::~LogicStage() {
  if (running()) stop();
}

void LogicStage::run(const std::atomic_bool& local) {
  Receiver<Event> events = std::move(events_);
  LatestSender<Picture> frames = std::move(frames_);
  Sender<FeedbackEvent> feedback = std::move(feedback_);

  try {
    audio_.initialize();
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize audio backend '" << audio_.name() << "': " << e.what() << std::endl;
    throw;
  }

  SimContext ctx(initial_size_, std::make_unique<DefaultFontSet>());

  std::unique_ptr<Game> game = factory_(ctx);
  if (!game) throw std::runtime_error("Game factory returned no game");
  game->set_size(ctx.window_size());

  const auto target_update_time = std::chrono::milliseconds(timing_.update_interval_ms);
  const auto target_frame_time = std::chrono::milliseconds(timing_.frame_interval_ms);
  // Overshoot carried into the next frame period. Capped so a stall does not turn into a burst of frames
  const Clock::duration max_frame_carry = std::chrono::duration_cast<Clock::duration>(target_frame_time) / 4;

  auto last_frame = Clock::now();
  std::uint64_t frame_seq = 0;

  while (!local.load(std::memory_order_relaxed)) {
    const auto t_update = Clock::now();
    game->update(ctx);
    Report(update_metrics_, t_update);

    // Drain everything that is queued before looking at the frame clock
    for (;;) {
      Event event;
      const PopStatus status = events.try_pop(event);
      if (status == PopStatus::Empty) break;
      if (status == PopStatus::Closed) {
        std::cout << name() << ": event channel closed, leaving without close()" << std::endl;
        return;
      }
      if (handle_event(*game, ctx, event, feedback)) return;
    }

    const auto now = Clock::now();
    const auto frame_time = now - last_frame;
    if (frame_time > target_frame_time) {
      last_frame = now - std::min<Clock::duration>(frame_time - target_frame_time, max_frame_carry);

      PictureRecorder rec;
      Canvas& canvas = rec.begin_recording(ctx.window_size(), &ctx.fonts());
      game->draw(canvas, ctx);

      // A full slot is overwritten; the presenter only ever sees the newest frame
      if (frames.try_push(rec.finish_recording(frame_seq++)) == PushStatus::Closed) {
        throw ChannelClosedError("frames");
      }

      ctx.draw_time().update();
      Report(draw_metrics_, now);
    }

    // Runs after a draw as well, so update ticks never come closer than the update interval
    const auto update_time = Clock::now() - ctx.update_time().last_update();
    if (target_update_time > update_time) {
      std::this_thread::sleep_for(target_update_time - update_time);
    }
    ctx.update_time().update();
  }

  std::cout << name() << ": stop requested, leaving without close()" << std::endl;
}

bool LogicStage::handle_event(Game& game, SimContext& ctx, const Event& event, Sender<FeedbackEvent>& feedback) {
  if (event.kind == Event::Kind::Crash) {
    const RendererError& error = event.crash.value();
    std::cerr << name() << ": renderer failed (code " << error.code() << "): " << error.what() << std::endl;
    game.crash(error);
    send_exit(feedback);
    return true;
  }

  const auto result = ctx.input().handle_event(event.input);
  if (!result) return false;

  switch (result->kind) {
    case EventHandleResult::Kind::Input:
      game.input(result->event, ctx);
      return false;
    case EventHandleResult::Kind::Resized:
      game.set_size(result->size);
      return false;
    case EventHandleResult::Kind::Exit:
      std::cout << name() << ": close requested" << std::endl;
      game.close();
      send_exit(feedback);
      return true;
  }
  return false;
}

// Full means an Exit is already waiting to be read, which is all the presentation thread needs
void LogicStage::send_exit(Sender<FeedbackEvent>& feedback) {
  if (feedback.try_push(FeedbackEvent::Exit) == PushStatus::Closed) {
    throw ChannelClosedError("feedback");
  }
}

} // namespace tbn
