#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

/*
    Normalized input event, produced by the presentation thread from whatever the window system reports and
    consumed exactly once, in order, by the logic thread.
*/

namespace tbn {

enum class MouseButton : std::uint8_t {
  Left,
  Right,
  Middle
};

struct InputEvent {
  enum class Type : std::uint8_t {
    PointerMoved,
    ButtonPressed,
    ButtonReleased,
    KeyPressed,
    KeyReleased,
    Scrolled,
    Resized,
    CloseRequested
  };

  Type type{Type::PointerMoved};

  cv::Point2f position{};            // PointerMoved, Button*, Scrolled
  MouseButton button{MouseButton::Left};
  int key{0};                        // Key*: window-system key code
  float scroll_delta{0.f};           // Scrolled: positive is away from the user
  cv::Size size{};                   // Resized

  static InputEvent PointerMoved(cv::Point2f p) {
    InputEvent e;
    e.type = Type::PointerMoved;
    e.position = p;
    return e;
  }

  static InputEvent Button(MouseButton b, bool pressed, cv::Point2f p) {
    InputEvent e;
    e.type = pressed ? Type::ButtonPressed : Type::ButtonReleased;
    e.button = b;
    e.position = p;
    return e;
  }

  static InputEvent Key(int code, bool pressed) {
    InputEvent e;
    e.type = pressed ? Type::KeyPressed : Type::KeyReleased;
    e.key = code;
    return e;
  }

  static InputEvent Scrolled(float delta, cv::Point2f p) {
    InputEvent e;
    e.type = Type::Scrolled;
    e.scroll_delta = delta;
    e.position = p;
    return e;
  }

  static InputEvent Resized(cv::Size s) {
    InputEvent e;
    e.type = Type::Resized;
    e.size = s;
    return e;
  }

  static InputEvent CloseRequested() {
    InputEvent e;
    e.type = Type::CloseRequested;
    return e;
  }
};

const char* ToString(InputEvent::Type type);

} // namespace tbn
