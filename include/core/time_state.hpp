#pragma once

#include <chrono>
#include <cstdint>

namespace tbn {

// Timing tracker for one cadence (update or draw). update() is called once per tick of that cadence
class TimeState {
public:
  using Clock = std::chrono::steady_clock;
  using Duration = Clock::duration;

  TimeState();

  void update();

  // Instant of the most recent tick (creation time before the first one)
  Clock::time_point last_update() const { return last_update_; }

  // Duration between the two most recent ticks
  Duration last_update_time() const { return last_update_time_; }

  // Time since the tracker was created
  Duration elapsed() const { return Clock::now() - start_; }

  std::uint64_t ticks() const { return ticks_; }

private:
  Clock::time_point start_;
  Clock::time_point last_update_;
  Duration last_update_time_{Duration::zero()};
  std::uint64_t ticks_{0};
};

} // namespace tbn
