#pragma once
#include "kb/input/PointerEvent.hpp"
#include <cstdint>

namespace kb {

// Folds per-button press/release reports from a mouse into the event stream
// of a single pointer. The pointer is down while any button is held: the
// first press is a pointerdown, releasing the last held button is a
// pointerup, and every button change in between is a pointermove carrying
// the changed button.
class MouseButtonTracker {
public:
  explicit MouseButtonTracker(PointerId pointerId) : pointerId_(pointerId) {}

  PointerEvent press(PointerButton button, double x, double y);
  PointerEvent release(PointerButton button, double x, double y);

  // Forget every held button (e.g. the window lost focus).
  void reset() { held_ = 0; }

  PointerId pointerId() const { return pointerId_; }
  bool anyHeld() const { return held_ != 0; }
  bool isHeld(PointerButton button) const { return (held_ & buttonBit(button)) != 0; }

private:
  static std::uint32_t buttonBit(PointerButton button);

  PointerId pointerId_;
  std::uint32_t held_{0};
};

} // namespace kb
