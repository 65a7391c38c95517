#pragma once

#include <optional>
#include <utility>

#include "core/errors.hpp"
#include "core/input_event.hpp"

namespace tbn {

// Presentation -> logic messages
struct Event {
  enum class Kind { Input, Crash };

  Kind kind{Kind::Input};
  InputEvent input{};
  std::optional<RendererError> crash;

  static Event FromInput(const InputEvent& e) {
    Event ev;
    ev.kind = Kind::Input;
    ev.input = e;
    return ev;
  }

  static Event FromCrash(RendererError error) {
    Event ev;
    ev.kind = Kind::Crash;
    ev.crash = std::move(error);
    return ev;
  }
};

// Logic -> presentation messages
enum class FeedbackEvent {
  Exit
};

} // namespace tbn
