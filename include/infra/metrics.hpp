#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/*
  Metrics owns one StageMetrics per runner loop (update, draw, present). Each loop reports the time it spent
  in its characteristic work; the HUD overlay and the console summary read the counters from the presentation
  thread. These are diagnostic atomics only, the simulation never reads them.

  QueueView is a read-only window onto a channel's depth and drop count.
*/

namespace tbn {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> count{0};
  std::atomic<std::uint64_t> avg_latency_ns{0};
  std::atomic<std::uint64_t> last_event_ns{0};

  std::atomic<std::uint64_t> work_ns_total{0};

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  // Exponential moving average with a 1/8 weight on the newest sample
  void on_item(std::uint64_t latency_ns) {
    count.fetch_add(1, std::memory_order_relaxed);

    auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);

    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }
};

class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

struct QueueView {
  std::string name;
  std::function<std::size_t()> size_fn;
  std::function<std::size_t()> cap_fn;
  std::function<std::uint64_t()> drops_fn;
};

// Works for BoundedQueue and LatestStore alike
template <typename Queue>
QueueView MakeQueueView(std::string name, std::shared_ptr<Queue> q) {
  QueueView v;
  v.name = std::move(name);
  v.size_fn = [q] { return q->size(); };
  v.cap_fn = [q] { return q->capacity(); };
  v.drops_fn = [q] { return q->drops_total(); };
  return v;
}

} // namespace tbn
