#pragma once
#include "kb/ids/Id.hpp"
#include "kb/math/Vec2.hpp"
#include <cstdint>

namespace kb {

enum class PointerEventKind : std::uint8_t {
  Down = 0,
  Move,
  Up,
  Cancel,
  LostCapture
};

// Button that triggered the event. Values follow the DOM MouseEvent.button
// numbering; Move/Cancel/LostCapture carry None.
enum class PointerButton : std::int8_t {
  None = -1,
  Primary = 0,
  Auxiliary = 1,
  Secondary = 2,
  Back = 3,
  Forward = 4
};

// Generic pointer event - NOT tied to any windowing library.
struct PointerEvent {
  PointerEventKind kind{PointerEventKind::Move};
  PointerId pointerId{0};
  PointerButton button{PointerButton::None};
  double clientX{0}, clientY{0};  // pixels, 0=left/top

  Vec2 client() const { return {clientX, clientY}; }

  static PointerEvent down(PointerId id, PointerButton button, double x, double y) {
    return {PointerEventKind::Down, id, button, x, y};
  }
  static PointerEvent move(PointerId id, double x, double y) {
    return {PointerEventKind::Move, id, PointerButton::None, x, y};
  }
  static PointerEvent up(PointerId id, double x = 0, double y = 0) {
    return {PointerEventKind::Up, id, PointerButton::Primary, x, y};
  }
  static PointerEvent cancel(PointerId id) {
    return {PointerEventKind::Cancel, id, PointerButton::None, 0, 0};
  }
  static PointerEvent lostCapture(PointerId id) {
    return {PointerEventKind::LostCapture, id, PointerButton::None, 0, 0};
  }
};

const char* pointerEventKindName(PointerEventKind kind);

} // namespace kb
