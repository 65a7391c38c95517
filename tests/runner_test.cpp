#include <cstdint>
#include <iostream>

#include "core/config.hpp"
#include "infra/stop_token.hpp"
#include "platform/audio.hpp"
#include "runtime/runner.hpp"

#include "test_support.hpp"

using tbn_test::Expect;

namespace {

tbn::RunnerConfig FastConfig() {
  tbn::RunnerConfig cfg;
  cfg.timing.update_interval_ms = 1;
  cfg.timing.frame_interval_ms = 4;
  cfg.timing.idle_sleep_ms = 1;
  cfg.window.hide_cursor = true;
  return cfg;
}

} // namespace

static void CloseRequestRunsCloseHook() {
  tbn_test::ScriptedWindow window;
  window.script(20, {tbn::InputEvent::CloseRequested()});
  tbn_test::FlakyRenderer renderer;
  tbn::NullAudioSystem audio;
  tbn_test::RecordingGame::Log log;

  tbn::Runner runner(FastConfig(), window, renderer, audio);
  const tbn::PresentationStopReason reason = runner.run(tbn_test::RecordingFactory(log));

  Expect(reason == tbn::PresentationStopReason::Exit, "close request ends with Exit");
  Expect(log.closes == 1, "close hook ran once");
  Expect(log.crashes == 0, "no crash hook");
  Expect(log.updates > 0, "game was updated");
  Expect(!window.cursor_visible(), "cursor hidden when configured");
  Expect(audio.initialized(), "audio initialized before the game");
  Expect(!log.sizes.empty() && log.sizes.front() == window.size(), "game told the initial window size");

  std::uint64_t updates = 0;
  for (const auto& s : runner.metrics().stages()) {
    if (s->name == "update") updates = s->count.load();
  }
  Expect(updates == log.updates, "update metrics count every update");
}

static void StopRequestRunsCloseHook() {
  tbn_test::ScriptedWindow window;
  tbn_test::FlakyRenderer renderer;
  tbn::NullAudioSystem audio;
  tbn_test::RecordingGame::Log log;

  tbn::StopSource stop;
  stop.request_stop();

  tbn::Runner runner(FastConfig(), window, renderer, audio);
  const tbn::PresentationStopReason reason = runner.run(tbn_test::RecordingFactory(log), stop.token());

  Expect(reason == tbn::PresentationStopReason::Exit, "stop request ends with Exit");
  Expect(log.closes == 1, "close hook ran once after a stop request");
}

static void RendererFailureRunsCrashHook() {
  tbn_test::ScriptedWindow window;
  tbn_test::FlakyRenderer renderer(3);
  tbn::NullAudioSystem audio;
  tbn_test::RecordingGame::Log log;

  tbn::Runner runner(FastConfig(), window, renderer, audio);
  const tbn::PresentationStopReason reason = runner.run(tbn_test::RecordingFactory(log));

  Expect(reason == tbn::PresentationStopReason::RendererCrashed, "renderer failure reported");
  Expect(log.crashes == 1, "crash hook ran once");
  Expect(log.crash_code == -4, "crash hook got the renderer's error");
  Expect(log.closes == 0, "close hook not run on a crash");
  Expect(renderer.draws_after_failure() == 0, "nothing drawn after the failure");
  Expect(window.presents() == 2, "two frames reached the window");
}

int main() {
  CloseRequestRunsCloseHook();
  StopRequestRunsCloseHook();
  RendererFailureRunsCrashHook();
  return tbn_test::Report("runner_test");
}
