#include "kb/drag/DragController.hpp"
#include <cstdio>

namespace kb {

static void logCaptureFailure(const char* op, PointerId id, const CaptureResult& r) {
  std::fprintf(stderr, "DragController: %s(%d) failed: %s %s\n",
               op, static_cast<int>(id), r.err.code.c_str(), r.err.message.c_str());
}

DragController::DragController(const DragConfig& cfg)
    : position_(cfg.initialPosition) {}

void DragController::onMounted(PointerCaptureTarget* handle) {
  handle_ = handle;
}

void DragController::onUnmounted() {
  handle_ = nullptr;
}

std::optional<PointerId> DragController::ownerPointerId() const {
  if (!session_) return std::nullopt;
  return session_->ownerPointerId;
}

bool DragController::ownsPointer(PointerId id) const {
  return session_ && session_->ownerPointerId == id;
}

void DragController::onPointerDown(const PointerEvent& evt) {
  if (evt.button != PointerButton::Primary) return;
  if (session_) return;  // one pointer per draggable

  if (handle_) {
    CaptureResult r = handle_->setPointerCapture(evt.pointerId);
    if (!r.ok) logCaptureFailure("setPointerCapture", evt.pointerId, r);
  } else {
    logCaptureFailure("setPointerCapture", evt.pointerId,
                      CaptureResult::failure("NO_HANDLE", "element not mounted"));
  }

  session_ = DragSession{evt.pointerId, evt.client(), position_};
}

void DragController::onPointerMove(const PointerEvent& evt) {
  if (!ownsPointer(evt.pointerId)) return;

  Vec2 delta = evt.client() - session_->clickOrigin;
  position_ = session_->positionOrigin + delta;
}

void DragController::onPointerUp(const PointerEvent& evt) {
  if (!ownsPointer(evt.pointerId)) return;
  endSession(evt.pointerId);
}

void DragController::onPointerCancel(const PointerEvent& evt) {
  if (!ownsPointer(evt.pointerId)) return;
  endSession(evt.pointerId);
}

void DragController::onLostPointerCapture() {
  session_.reset();
}

void DragController::endSession(PointerId id) {
  // Clear first: releasing may synchronously deliver LostCapture back to us.
  session_.reset();

  if (!handle_) return;
  CaptureResult r = handle_->releasePointerCapture(id);
  if (!r.ok) logCaptureFailure("releasePointerCapture", id, r);
}

bool DragController::processEvent(const PointerEvent& evt) {
  const bool wasDragging = isDragging();
  const Vec2 before = position_;

  switch (evt.kind) {
    case PointerEventKind::Down:        onPointerDown(evt); break;
    case PointerEventKind::Move:        onPointerMove(evt); break;
    case PointerEventKind::Up:          onPointerUp(evt); break;
    case PointerEventKind::Cancel:      onPointerCancel(evt); break;
    case PointerEventKind::LostCapture: onLostPointerCapture(); break;
  }

  return wasDragging != isDragging() || before != position_;
}

} // namespace kb
