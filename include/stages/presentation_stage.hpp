#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "apps/hud_overlay.hpp"
#include "core/config.hpp"
#include "core/events.hpp"
#include "core/picture.hpp"
#include "infra/channel.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "platform/renderer.hpp"
#include "platform/window.hpp"

namespace tbn {

enum class PresentationStopReason {
  Exit,             // logic thread sent Exit
  LogicGone,        // a channel to the logic thread was found disconnected
  RendererCrashed   // presenting failed, a Crash event was forwarded
};

const char* ToString(PresentationStopReason reason);

/*
    The presentation loop. Runs on the calling thread, which must be the one that owns the window.

    It never blocks on the logic thread except for forwarding input while the event channel is full: feedback and
    frames are polled, and when no frame is ready it sleeps out the rest of the idle quantum so the window keeps
    being pumped. A window pump that itself waits (highgui's waitKey) uses up part or all of that quantum.
*/
class PresentationStage {
public:
  PresentationStage(const RunnerConfig& cfg,
                    Window& window,
                    Renderer& renderer,
                    Sender<Event>& events,
                    LatestReceiver<Picture>& frames,
                    Receiver<FeedbackEvent>& feedback,
                    const Metrics* metrics = nullptr,
                    StageMetrics* present_metrics = nullptr,
                    std::vector<QueueView> queues = {});

  PresentationStage(const PresentationStage&) = delete;
  PresentationStage& operator=(const PresentationStage&) = delete;

  // A stop request on 'stop' is forwarded once as CloseRequested, then the loop waits for Exit as usual
  PresentationStopReason run(const StopToken& stop = StopToken());

  std::uint64_t frames_presented() const { return frames_presented_; }

private:
  PresentationStopReason finish(PresentationStopReason reason);
  void present(const Picture& picture);
  void maybe_log_summary();

  RunnerConfig cfg_;
  Window& window_;
  Renderer& renderer_;
  Sender<Event>& events_;
  LatestReceiver<Picture>& frames_;
  Receiver<FeedbackEvent>& feedback_;

  const Metrics* metrics_;
  StageMetrics* present_metrics_;
  std::vector<QueueView> queues_;
  std::unique_ptr<HudOverlay> hud_;

  cv::Scalar background_;
  std::uint64_t frames_presented_{0};

  std::chrono::steady_clock::time_point last_summary_{};
  std::unordered_map<const StageMetrics*, std::uint64_t> summary_counts_;
};

} // namespace tbn
