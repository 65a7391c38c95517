#pragma once

#include <atomic>
#include <cstdint>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/events.hpp"
#include "core/game.hpp"
#include "core/picture.hpp"
#include "core/sim_context.hpp"
#include "infra/channel.hpp"
#include "infra/metrics.hpp"
#include "platform/audio.hpp"
#include "stages/stage.hpp"

namespace tbn {

/*
    The logic thread. Owns the game and its SimContext for the lifetime of the thread.

    Each iteration: update the game, drain all queued events, draw a frame if the frame interval has passed,
    then sleep whatever is left of the update interval. The sleep also follows iterations that drew, so two
    update ticks are never closer than the update interval. A CloseRequested input or a Crash event ends the loop
    after the matching game hook ran and Exit was sent back to the presentation thread.

    The channel endpoints are moved onto the thread when it starts, so returning from run() closes them and the
    presentation side sees the disconnect.
*/
class LogicStage final : public Stage {
public:
  LogicStage(TimingConfig timing,
             cv::Size initial_size,
             GameFactory factory,
             AudioSystem& audio,
             Receiver<Event> events,
             LatestSender<Picture> frames,
             Sender<FeedbackEvent> feedback,
             StageMetrics* update_metrics = nullptr,
             StageMetrics* draw_metrics = nullptr);

  // Joins here, while the members run() reads are still alive
  ~LogicStage() override;

protected:
  void run(const std::atomic_bool& local_stop) override;

private:
  // Returns true when the loop must end
  bool handle_event(Game& game, SimContext& ctx, const Event& event, Sender<FeedbackEvent>& feedback);
  void send_exit(Sender<FeedbackEvent>& feedback);

  TimingConfig timing_;
  cv::Size initial_size_;
  GameFactory factory_;
  AudioSystem& audio_;

  Receiver<Event> events_;
  LatestSender<Picture> frames_;
  Sender<FeedbackEvent> feedback_;

  StageMetrics* update_metrics_;
  StageMetrics* draw_metrics_;
};

} // namespace tbn
