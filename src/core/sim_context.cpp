#include "core/sim_context.hpp"

#include <stdexcept>
#include <utility>

namespace tbn {

static cv::Size CheckedSize(cv::Size s) {
  if (s.width <= 0 || s.height <= 0) throw std::invalid_argument("SimContext: window size must be > 0");
  return s;
}

SimContext::SimContext(cv::Size window_size, std::unique_ptr<FontSet> fonts)
    : owner_(std::this_thread::get_id()), input_state_(CheckedSize(window_size)), font_set_(std::move(fonts)) {
  if (!font_set_) throw std::invalid_argument("SimContext: font set is required");
}

void SimContext::EnsureOwner() const {
  if (std::this_thread::get_id() != owner_) {
    throw std::logic_error("Attempt to access simulation state from outside the logic thread");
  }
}

SimContext::Duration SimContext::update_delta() const {
  EnsureOwner();
  return time_state_.last_update_time();
}

SimContext::Duration SimContext::update_elapsed() const {
  EnsureOwner();
  return time_state_.elapsed();
}

SimContext::Duration SimContext::draw_delta() const {
  EnsureOwner();
  return time_state_draw_.last_update_time();
}

SimContext::Duration SimContext::draw_elapsed() const {
  EnsureOwner();
  return time_state_draw_.elapsed();
}

cv::Point2f SimContext::pointer_position() const {
  EnsureOwner();
  return input_state_.mouse_position();
}

cv::Size SimContext::window_size() const {
  EnsureOwner();
  return input_state_.window_size();
}

const FontSet& SimContext::fonts() const {
  EnsureOwner();
  return *font_set_;
}

const InputState& SimContext::input() const {
  EnsureOwner();
  return input_state_;
}

const TimeState& SimContext::update_time() const {
  EnsureOwner();
  return time_state_;
}

const TimeState& SimContext::draw_time() const {
  EnsureOwner();
  return time_state_draw_;
}

InputState& SimContext::input() {
  EnsureOwner();
  return input_state_;
}

TimeState& SimContext::update_time() {
  EnsureOwner();
  return time_state_;
}

TimeState& SimContext::draw_time() {
  EnsureOwner();
  return time_state_draw_;
}

Id SimContext::next_id() {
  EnsureOwner();
  return Id{id_keeper_++};
}

} // namespace tbn
