#include "kb/input/MouseButtons.hpp"

namespace kb {

std::uint32_t MouseButtonTracker::buttonBit(PointerButton button) {
  if (button == PointerButton::None) return 0;
  return 1u << static_cast<int>(button);
}

PointerEvent MouseButtonTracker::press(PointerButton button, double x, double y) {
  bool wasIdle = held_ == 0;
  held_ |= buttonBit(button);

  if (wasIdle && held_ != 0) {
    return PointerEvent::down(pointerId_, button, x, y);
  }
  PointerEvent evt = PointerEvent::move(pointerId_, x, y);
  evt.button = button;
  return evt;
}

PointerEvent MouseButtonTracker::release(PointerButton button, double x, double y) {
  std::uint32_t bit = buttonBit(button);
  bool wasHeld = (held_ & bit) != 0;
  held_ &= ~bit;

  PointerEvent evt = (wasHeld && held_ == 0)
    ? PointerEvent::up(pointerId_, x, y)
    : PointerEvent::move(pointerId_, x, y);
  evt.button = button;
  return evt;
}

} // namespace kb
