#pragma once
#include "kb/ids/Id.hpp"
#include "kb/input/PointerCapture.hpp"
#include "kb/input/PointerEvent.hpp"
#include "kb/math/Vec2.hpp"

#include <optional>

namespace kb {

struct DragConfig {
  Vec2 initialPosition{100.0, 100.0};
};

// Reference points of one drag. Exists only while dragging.
struct DragSession {
  PointerId ownerPointerId{0};
  Vec2 clickOrigin;     // pointer client coords at pointer-down
  Vec2 positionOrigin;  // element position at pointer-down
};

// Pointer-driven drag state machine for one draggable element.
// States: Idle <-> Dragging(ownerPointerId)
//
// position = positionOrigin + (pointer - clickOrigin); no clamping.
// Events from a pointer other than the owner are ignored. LostCapture ends
// the drag regardless of which pointer lost capture.
// Pointer capture is best-effort: failures are logged and otherwise ignored.
class DragController {
public:
  DragController() = default;
  explicit DragController(const DragConfig& cfg);

  void onMounted(PointerCaptureTarget* handle);
  void onUnmounted();

  void onPointerDown(const PointerEvent& evt);
  void onPointerMove(const PointerEvent& evt);
  void onPointerUp(const PointerEvent& evt);
  void onPointerCancel(const PointerEvent& evt);
  void onLostPointerCapture();

  // Route by evt.kind. Returns true if drag state or position changed.
  bool processEvent(const PointerEvent& evt);

  const Vec2& position() const { return position_; }
  bool isDragging() const { return session_.has_value(); }
  std::optional<PointerId> ownerPointerId() const;
  bool isMounted() const { return handle_ != nullptr; }

private:
  Vec2 position_{100.0, 100.0};
  std::optional<DragSession> session_;
  PointerCaptureTarget* handle_{nullptr};

  bool ownsPointer(PointerId id) const;
  void endSession(PointerId id);
};

} // namespace kb
