#pragma once
#include <atomic>

/*
    StopSource / StopToken carry an external shutdown request (for example SIGINT in the demo app)
    into the runner.

    The StopSource is owned by whoever can ask the application to quit. The presentation loop holds a
    StopToken and, when a stop is requested, turns it into a regular close request so the game still goes
    through its close() hook. The logic thread never reads the global token directly; it only reacts to the
    Exit protocol or to its own ThreadRunner's local stop during teardown.
*/

namespace tbn {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
};

} // namespace tbn
