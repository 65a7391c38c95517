#include "core/input_state.hpp"

namespace tbn {

InputState::InputState(cv::Size window_size) : window_size_(window_size) {}

static EventHandleResult AsInput(const InputEvent& event) {
  EventHandleResult r;
  r.kind = EventHandleResult::Kind::Input;
  r.event = event;
  return r;
}

std::optional<EventHandleResult> InputState::handle_event(const InputEvent& event) {
  switch (event.type) {
    case InputEvent::Type::PointerMoved:
    case InputEvent::Type::Scrolled:
      mouse_position_ = event.position;
      return AsInput(event);

    case InputEvent::Type::ButtonPressed:
      mouse_position_ = event.position;
      buttons_down_.insert(event.button);
      return AsInput(event);

    case InputEvent::Type::ButtonReleased:
      mouse_position_ = event.position;
      if (buttons_down_.erase(event.button) == 0) return std::nullopt;
      return AsInput(event);

    case InputEvent::Type::KeyPressed:
      // Auto-repeat still reaches the game
      keys_down_.insert(event.key);
      return AsInput(event);

    case InputEvent::Type::KeyReleased:
      if (keys_down_.erase(event.key) == 0) return std::nullopt;
      return AsInput(event);

    case InputEvent::Type::Resized: {
      if (event.size == window_size_) return std::nullopt;
      window_size_ = event.size;
      EventHandleResult r;
      r.kind = EventHandleResult::Kind::Resized;
      r.event = event;
      r.size = event.size;
      return r;
    }

    case InputEvent::Type::CloseRequested: {
      EventHandleResult r;
      r.kind = EventHandleResult::Kind::Exit;
      r.event = event;
      return r;
    }
  }
  return std::nullopt;
}

} // namespace tbn
