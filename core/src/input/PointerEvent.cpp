#include "kb/input/PointerEvent.hpp"

namespace kb {

const char* pointerEventKindName(PointerEventKind kind) {
  switch (kind) {
    case PointerEventKind::Down:        return "pointerdown";
    case PointerEventKind::Move:        return "pointermove";
    case PointerEventKind::Up:          return "pointerup";
    case PointerEventKind::Cancel:      return "pointercancel";
    case PointerEventKind::LostCapture: return "lostpointercapture";
  }
  return "unknown";
}

} // namespace kb
