#include "core/input_event.hpp"

namespace tbn {

const char* ToString(InputEvent::Type type) {
  switch (type) {
    case InputEvent::Type::PointerMoved: return "pointer_moved";
    case InputEvent::Type::ButtonPressed: return "button_pressed";
    case InputEvent::Type::ButtonReleased: return "button_released";
    case InputEvent::Type::KeyPressed: return "key_pressed";
    case InputEvent::Type::KeyReleased: return "key_released";
    case InputEvent::Type::Scrolled: return "scrolled";
    case InputEvent::Type::Resized: return "resized";
    case InputEvent::Type::CloseRequested: return "close_requested";
  }
  return "unknown";
}

} // namespace tbn
