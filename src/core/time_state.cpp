#include "core/time_state.hpp"

namespace tbn {

TimeState::TimeState() : start_(Clock::now()), last_update_(start_) {}

void TimeState::update() {
  const auto now = Clock::now();
  last_update_time_ = now - last_update_;
  last_update_ = now;
  ++ticks_;
}

} // namespace tbn
