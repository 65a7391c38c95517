#include "runtime/runner.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "core/config_loader.hpp"
#include "core/events.hpp"
#include "infra/channel.hpp"
#include "platform/highgui_window.hpp"
#include "stages/logic_stage.hpp"

namespace tbn {

Runner::Runner(RunnerConfig cfg, Window& window, Renderer& renderer, AudioSystem& audio)
    : cfg_(std::move(cfg)), window_(window), renderer_(renderer), audio_(audio) {
  update_metrics_ = metrics_.make_stage("update");
  draw_metrics_ = metrics_.make_stage("draw");
  present_metrics_ = metrics_.make_stage("present");
}

PresentationStopReason Runner::run(GameFactory factory, StopToken stop) {
  if (cfg_.window.hide_cursor) window_.set_cursor_visible(false);

  auto [event_tx, event_rx] = MakeChannel<Event>(cfg_.channels.event_capacity);
  auto [frame_tx, frame_rx] = MakeLatestChannel<Picture>();
  auto [feedback_tx, feedback_rx] = MakeChannel<FeedbackEvent>(kFeedbackQueueSize);

  std::vector<QueueView> queues;
  queues.push_back(MakeQueueView("events", event_tx.queue()));
  queues.push_back(MakeQueueView("frames", frame_tx.queue()));
  queues.push_back(MakeQueueView("feedback", feedback_tx.queue()));

  // If presentation throws, the stage's destructor raises its local stop and joins
  LogicStage logic(cfg_.timing, window_.size(), std::move(factory), audio_,
                   std::move(event_rx), std::move(frame_tx), std::move(feedback_tx),
                   update_metrics_, draw_metrics_);
  logic.start();

  PresentationStage presentation(cfg_, window_, renderer_, event_tx, frame_rx, feedback_rx,
                                 &metrics_, present_metrics_, std::move(queues));
  const PresentationStopReason reason = presentation.run(stop);

  // The logic thread drains what is queued (a forwarded crash included), then sees the disconnect.
  // frame_rx and feedback_rx stay open until it has returned
  event_tx.close();
  logic.join();

  return reason;
}

Builder& Builder::config(RunnerConfig cfg) {
  cfg_ = std::move(cfg);
  return *this;
}

Builder& Builder::inner_size(cv::Size size) {
  cfg_.window.width = size.width;
  cfg_.window.height = size.height;
  return *this;
}

Builder& Builder::window_title(std::string title) {
  cfg_.window.title = std::move(title);
  return *this;
}

Builder& Builder::app_name(std::string name) {
  cfg_.window.app_name = std::move(name);
  return *this;
}

Builder& Builder::stop_token(StopToken stop) {
  stop_ = stop;
  return *this;
}

PresentationStopReason Builder::run(GameFactory factory) {
  ValidateOrThrow(cfg_);

  std::cout << cfg_.window.app_name << ": " << cfg_.window.width << "x" << cfg_.window.height
            << ", update every " << cfg_.timing.update_interval_ms << "ms, frame every "
            << cfg_.timing.frame_interval_ms << "ms" << std::endl;

  HighGuiWindow window(cfg_.window);
  MatRenderer renderer;
  std::unique_ptr<AudioSystem> audio = MakeAudioSystem(cfg_.audio);

  Runner runner(cfg_, window, renderer, *audio);
  return runner.run(std::move(factory), stop_);
}

} // namespace tbn
