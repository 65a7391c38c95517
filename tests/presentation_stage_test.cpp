#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/events.hpp"
#include "infra/channel.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "platform/window.hpp"
#include "stages/presentation_stage.hpp"

#include "test_support.hpp"

using tbn_test::Expect;
using namespace std::chrono_literals;

namespace {

struct Channels {
  std::pair<tbn::Sender<tbn::Event>, tbn::Receiver<tbn::Event>> events = tbn::MakeChannel<tbn::Event>(8);
  std::pair<tbn::LatestSender<tbn::Picture>, tbn::LatestReceiver<tbn::Picture>> frames =
      tbn::MakeLatestChannel<tbn::Picture>();
  std::pair<tbn::Sender<tbn::FeedbackEvent>, tbn::Receiver<tbn::FeedbackEvent>> feedback =
      tbn::MakeChannel<tbn::FeedbackEvent>(1);
};

tbn::Picture SolidFrame(cv::Size size, std::uint64_t seq) {
  tbn::PictureRecorder rec;
  tbn::Canvas& canvas = rec.begin_recording(size, nullptr);
  canvas.draw_rect(cv::Rect2f(0.f, 0.f, 10.f, 10.f), tbn::Paint(tbn::Color::FromRgb(255, 0, 0)));
  return rec.finish_recording(seq);
}

tbn::RunnerConfig Config() {
  tbn::RunnerConfig cfg;
  cfg.render.background = tbn::RgbColor{0, 0, 200};
  return cfg;
}

// Window whose event pump blocks for a while, like highgui's waitKey
class WaitingWindow final : public tbn::Window {
public:
  explicit WaitingWindow(std::chrono::milliseconds wait) : wait_(wait) {}

  cv::Size size() const override { return cv::Size(64, 48); }
  void poll_events(std::vector<tbn::InputEvent>&) override {
    ++polls_;
    std::this_thread::sleep_for(wait_);
  }
  void present(const cv::Mat&) override {}
  void set_cursor_visible(bool) override {}

  std::size_t polls() const { return polls_; }

private:
  std::chrono::milliseconds wait_;
  std::size_t polls_{0};
};

// Sends Exit after 'delay' from another thread
std::thread ExitAfter(tbn::Sender<tbn::FeedbackEvent>& feedback, std::chrono::milliseconds delay) {
  return std::thread([&feedback, delay] {
    std::this_thread::sleep_for(delay);
    feedback.try_push(tbn::FeedbackEvent::Exit);
  });
}

} // namespace

static void ExitStopsBeforePumping() {
  Channels ch;
  tbn_test::ScriptedWindow window;
  tbn_test::FlakyRenderer renderer;
  ch.feedback.first.try_push(tbn::FeedbackEvent::Exit);

  tbn::PresentationStage stage(Config(), window, renderer, ch.events.first, ch.frames.second, ch.feedback.second);
  Expect(stage.run() == tbn::PresentationStopReason::Exit, "Exit feedback ends the loop");
  Expect(window.polls() == 0, "no OS events pumped after Exit");
  Expect(renderer.draws() == 0, "nothing presented after Exit");
}

static void LogicGoneEndsLoop() {
  Channels ch;
  tbn_test::ScriptedWindow window;
  tbn_test::FlakyRenderer renderer;
  ch.feedback.first.close();

  tbn::PresentationStage stage(Config(), window, renderer, ch.events.first, ch.frames.second, ch.feedback.second);
  Expect(stage.run() == tbn::PresentationStopReason::LogicGone, "closed feedback channel ends the loop");
}

static void ForwardsEventsAndPresents() {
  Channels ch;
  tbn_test::ScriptedWindow window(cv::Size(40, 30));
  tbn_test::FlakyRenderer renderer;

  window.script(0, {tbn::InputEvent::PointerMoved(cv::Point2f(1.f, 1.f)),
                    tbn::InputEvent::PointerMoved(cv::Point2f(2.f, 2.f))});
  window.script(1, {tbn::InputEvent::PointerMoved(cv::Point2f(3.f, 3.f))});
  ch.frames.first.try_push(SolidFrame(window.size(), 1));

  // Stands in for the logic thread: collects events, answers the close request with Exit
  std::vector<tbn::Event> seen;
  std::thread logic([&ch, &seen] {
    for (;;) {
      tbn::Event ev;
      const tbn::PopStatus s = ch.events.second.try_pop(ev);
      if (s == tbn::PopStatus::Closed) return;
      if (s == tbn::PopStatus::Empty) {
        std::this_thread::sleep_for(1ms);
        continue;
      }
      seen.push_back(ev);
      if (ev.kind == tbn::Event::Kind::Input && ev.input.type == tbn::InputEvent::Type::CloseRequested) {
        ch.feedback.first.try_push(tbn::FeedbackEvent::Exit);
        return;
      }
    }
  });

  tbn::StopSource stop;
  tbn::PresentationStage stage(Config(), window, renderer, ch.events.first, ch.frames.second, ch.feedback.second);

  // Let two polls happen before asking to stop
  std::thread stopper([&stop] {
    std::this_thread::sleep_for(20ms);
    stop.request_stop();
  });

  const tbn::PresentationStopReason reason = stage.run(stop.token());
  stopper.join();
  logic.join();

  Expect(reason == tbn::PresentationStopReason::Exit, "stop request went through the Exit protocol");
  Expect(seen.size() == 4, "three pointer moves and one close forwarded");
  for (std::size_t i = 0; i + 1 < seen.size(); ++i) {
    Expect(seen[i].input.position.x == static_cast<float>(i + 1), "events forwarded in OS order");
  }
  std::size_t closes = 0;
  for (const auto& ev : seen) closes += (ev.input.type == tbn::InputEvent::Type::CloseRequested) ? 1 : 0;
  Expect(closes == 1, "stop request forwarded exactly once");

  Expect(stage.frames_presented() == 1 && window.presents() == 1, "the one frame was presented");
  const cv::Mat& img = window.last_image();
  Expect(img.at<cv::Vec3b>(2, 2) == cv::Vec3b(0, 0, 255), "frame composited");
  Expect(img.at<cv::Vec3b>(20, 30) == cv::Vec3b(200, 0, 0), "surface cleared to the background first");
}

// Renderer fails on the third presented frame
static void RendererFailureForwardsCrash() {
  Channels ch;
  tbn_test::ScriptedWindow window;
  tbn_test::FlakyRenderer renderer(3);

  std::atomic<bool> producing{true};
  std::thread producer([&ch, &producing] {
    std::uint64_t seq = 0;
    while (producing.load()) {
      ch.frames.first.try_push(SolidFrame(cv::Size(320, 240), ++seq));
      std::this_thread::sleep_for(2ms);
    }
  });

  tbn::PresentationStage stage(Config(), window, renderer, ch.events.first, ch.frames.second, ch.feedback.second);
  const tbn::PresentationStopReason reason = stage.run();
  const std::size_t polls_at_stop = window.polls();
  producing.store(false);
  producer.join();

  Expect(reason == tbn::PresentationStopReason::RendererCrashed, "renderer failure ends the loop");
  Expect(renderer.draws() == 3, "failed on the third draw, no draw afterwards");
  Expect(renderer.draws_after_failure() == 0, "no presentation attempted after the failure");
  Expect(window.polls() == polls_at_stop, "no event pumping after the failure");
  Expect(stage.frames_presented() == 2, "two frames made it");

  std::size_t crashes = 0;
  std::size_t after_crash = 0;
  tbn::Event ev;
  while (ch.events.second.try_pop(ev) == tbn::PopStatus::Ok) {
    if (crashes > 0) ++after_crash;
    if (ev.kind == tbn::Event::Kind::Crash) {
      ++crashes;
      Expect(ev.crash && ev.crash->code() == -4, "crash carries the renderer error");
    }
  }
  Expect(crashes == 1, "exactly one crash notification");
  Expect(after_crash == 0, "nothing forwarded after the crash notification");
}

// The pump's own wait is part of the idle quantum, not added on top of it
static void PumpWaitCountsAsIdle() {
  Channels ch;
  WaitingWindow window(3ms);
  tbn_test::FlakyRenderer renderer;
  tbn::RunnerConfig cfg = Config();
  cfg.timing.idle_sleep_ms = 3;

  tbn::PresentationStage stage(cfg, window, renderer, ch.events.first, ch.frames.second, ch.feedback.second);
  std::thread exiter = ExitAfter(ch.feedback.first, 90ms);
  const tbn::PresentationStopReason reason = stage.run();
  exiter.join();

  std::cout << "idle: " << window.polls() << " polls in 90 ms" << std::endl;
  Expect(reason == tbn::PresentationStopReason::Exit, "Exit ends the idle loop");
  // About 30 iterations of one quantum each; a pump plus a full sleep would give about 15
  Expect(window.polls() >= 22, "idle iteration lasts one quantum");
}

static void HudDrawnTopRight() {
  Channels ch;
  tbn_test::ScriptedWindow window(cv::Size(400, 300));
  tbn_test::FlakyRenderer renderer;
  tbn::RunnerConfig cfg = Config();
  cfg.visualization.show_hud = true;

  tbn::Metrics metrics;
  tbn::StageMetrics* present = metrics.make_stage("present");
  std::vector<tbn::QueueView> queues;
  queues.push_back(tbn::MakeQueueView("frames", ch.frames.first.queue()));

  tbn::PictureRecorder rec;
  rec.begin_recording(window.size(), nullptr);
  ch.frames.first.try_push(rec.finish_recording(1));

  tbn::PresentationStage stage(cfg, window, renderer, ch.events.first, ch.frames.second, ch.feedback.second,
                               &metrics, present, queues);
  std::thread exiter = ExitAfter(ch.feedback.first, 30ms);
  stage.run();
  exiter.join();

  Expect(window.presents() == 1, "frame presented with the overlay");
  Expect(present->count.load() == 1, "present loop reported to its metrics");

  // Panel is 320 px wide with a 6 px margin: columns 74..393, rows from 6 down
  const cv::Mat& img = window.last_image();
  const cv::Vec3b background(200, 0, 0);
  Expect(img.at<cv::Vec3b>(6, 74) == cv::Vec3b(80, 80, 80), "panel border at the top-right corner");
  Expect(img.at<cv::Vec3b>(8, 374) == cv::Vec3b(0, 0, 0), "panel body is dark");
  Expect(img.at<cv::Vec3b>(3, 200) == background, "margin above the panel untouched");
  Expect(img.at<cv::Vec3b>(50, 20) == background, "left of the panel untouched");
  Expect(img.at<cv::Vec3b>(280, 200) == background, "below the panel untouched");
}

int main() {
  ExitStopsBeforePumping();
  LogicGoneEndsLoop();
  ForwardsEventsAndPresents();
  RendererFailureForwardsCrash();
  PumpWaitCountsAsIdle();
  HudDrawnTopRight();
  return tbn_test::Report("presentation_stage_test");
}
