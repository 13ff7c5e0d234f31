// K2.1 - PointerDispatcher routing and capture bookkeeping (pure C++, no GL)
// Tests: hit-test routing, capture routing, capture errors, implicit release
// after up, capture stealing, revoke, element removal, re-entrant handlers.

#include "kb/input/PointerDispatcher.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Records every event delivered to one element.
struct Probe {
  kb::PointerCaptureTarget* handle{nullptr};
  bool unmounted{false};
  std::vector<std::string> log;

  kb::PointerHandlers handlers() {
    kb::PointerHandlers h;
    h.onMounted = [this](kb::PointerCaptureTarget* t) { handle = t; };
    h.onUnmounted = [this]() { unmounted = true; handle = nullptr; };
    auto rec = [this](const kb::PointerEvent& e) {
      log.push_back(std::string(kb::pointerEventKindName(e.kind)) + ":" +
                    std::to_string(e.pointerId));
    };
    h.onPointerDown = rec;
    h.onPointerMove = rec;
    h.onPointerUp = rec;
    h.onPointerCancel = rec;
    h.onLostPointerCapture = rec;
    return h;
  }

  bool saw(const std::string& entry) const {
    for (const auto& l : log) if (l == entry) return true;
    return false;
  }
};

static kb::HitTestFn rect(double x0, double y0, double x1, double y1) {
  return [=](double x, double y) { return x >= x0 && x < x1 && y >= y0 && y < y1; };
}

int main() {
  using kb::PointerButton;
  using kb::PointerEvent;

  // --- Test 1: registration mounts, topmost element wins the hit test ---
  {
    kb::PointerDispatcher d;
    Probe below, above;
    kb::ElementId a = d.addElement(below.handlers(), rect(0, 0, 100, 100));
    kb::ElementId b = d.addElement(above.handlers(), rect(50, 50, 150, 150));

    requireTrue(a != kb::kInvalidElement && b != kb::kInvalidElement && a != b, "distinct ids");
    requireTrue(below.handle && above.handle, "mounted with handles");
    requireTrue(d.elementCount() == 2, "two elements");

    requireTrue(d.hitTest(75, 75) == b, "overlap goes to topmost");
    requireTrue(d.hitTest(10, 10) == a, "lower element where alone");
    requireTrue(d.hitTest(500, 500) == kb::kInvalidElement, "empty surface");

    requireTrue(d.dispatch(PointerEvent::move(1, 10, 10)) == a, "hover move routed by hit test");
    requireTrue(below.saw("pointermove:1"), "lower element saw move");
    std::printf("  Test 1 (hit-test routing) PASS\n");
  }

  // --- Test 2: capture routes events outside the element's bounds ---
  {
    kb::PointerDispatcher d;
    Probe p;
    kb::ElementId a = d.addElement(p.handlers(), rect(0, 0, 100, 100));

    d.dispatch(PointerEvent::down(1, PointerButton::Primary, 10, 10));
    requireTrue(d.isPointerActive(1), "pointer active after down");
    requireTrue(p.handle->setPointerCapture(1).ok, "capture granted");
    requireTrue(p.handle->hasPointerCapture(1), "handle reports capture");
    requireTrue(d.capturingElement(1) == a, "dispatcher reports capture");

    requireTrue(d.dispatch(PointerEvent::move(1, 900, 900)) == a, "captured move goes to element");
    requireTrue(p.saw("pointermove:1"), "element saw captured move");

    // Up with capture still held → implicit release delivers lost capture.
    requireTrue(d.dispatch(PointerEvent::up(1, 900, 900)) == a, "up goes to capturer");
    requireTrue(!d.isPointerActive(1), "pointer inactive after up");
    requireTrue(d.capturingElement(1) == kb::kInvalidElement, "capture dropped after up");
    requireTrue(p.log.back() == "lostpointercapture:1", "lost capture delivered last");

    requireTrue(d.dispatch(PointerEvent::move(1, 900, 900)) == kb::kInvalidElement,
                "move after release falls back to hit test");
    std::printf("  Test 2 (capture routing, implicit release) PASS\n");
  }

  // --- Test 3: capture errors ---
  {
    kb::PointerDispatcher d;
    Probe p;
    d.addElement(p.handlers(), rect(0, 0, 100, 100));

    kb::CaptureResult r = p.handle->setPointerCapture(42);
    requireTrue(!r.ok && r.err.code == "NotFoundError", "capture of inactive pointer fails");

    r = p.handle->releasePointerCapture(42);
    requireTrue(!r.ok && r.err.code == "NotFoundError", "release of inactive pointer fails");

    d.dispatch(PointerEvent::down(42, PointerButton::Primary, 5, 5));
    r = p.handle->releasePointerCapture(42);
    requireTrue(r.ok, "release without holding capture is a no-op");
    requireTrue(!p.saw("lostpointercapture:42"), "no lost capture for a no-op release");

    requireTrue(p.handle->setPointerCapture(42).ok, "capture ok");
    requireTrue(p.handle->releasePointerCapture(42).ok, "explicit release ok");
    requireTrue(p.saw("lostpointercapture:42"), "explicit release delivers lost capture");
    requireTrue(d.capturingElement(42) == kb::kInvalidElement, "capture gone");
    std::printf("  Test 3 (capture errors) PASS\n");
  }

  // --- Test 4: another element stealing capture ---
  {
    kb::PointerDispatcher d;
    Probe first, second;
    d.addElement(first.handlers(), rect(0, 0, 100, 100));
    kb::ElementId b = d.addElement(second.handlers(), rect(200, 0, 300, 100));

    d.dispatch(PointerEvent::down(3, PointerButton::Primary, 10, 10));
    requireTrue(first.handle->setPointerCapture(3).ok, "first captures");
    requireTrue(second.handle->setPointerCapture(3).ok, "second steals");
    requireTrue(d.capturingElement(3) == b, "second holds capture");
    requireTrue(first.saw("lostpointercapture:3"), "first told it lost capture");
    requireTrue(!second.saw("lostpointercapture:3"), "second not told");
    std::printf("  Test 4 (capture steal) PASS\n");
  }

  // --- Test 5: host revokes captures out of band ---
  {
    kb::PointerDispatcher d;
    Probe p, q;
    d.addElement(p.handlers(), rect(0, 0, 100, 100));
    d.addElement(q.handlers(), rect(200, 0, 300, 100));

    d.dispatch(PointerEvent::down(1, PointerButton::Primary, 10, 10));
    d.dispatch(PointerEvent::down(2, PointerButton::Primary, 210, 10));
    p.handle->setPointerCapture(1);
    q.handle->setPointerCapture(2);

    d.revokeCapture(1);
    requireTrue(p.saw("lostpointercapture:1"), "revoke one");
    requireTrue(d.capturingElement(2) != kb::kInvalidElement, "other capture kept");

    d.revokeAllCaptures();
    requireTrue(q.saw("lostpointercapture:2"), "revoke all");
    requireTrue(d.capturingElement(2) == kb::kInvalidElement, "no captures left");

    d.revokeAllCaptures();  // nothing to revoke
    requireTrue(d.isPointerActive(1) && d.isPointerActive(2), "revoke keeps pointers active");
    std::printf("  Test 5 (revoke) PASS\n");
  }

  // --- Test 6: removal drops capture, unmounts, and invalidates the id ---
  {
    kb::PointerDispatcher d;
    Probe p;
    kb::ElementId a = d.addElement(p.handlers(), rect(0, 0, 100, 100));

    d.dispatch(PointerEvent::down(9, PointerButton::Primary, 10, 10));
    p.handle->setPointerCapture(9);

    requireTrue(d.removeElement(a), "removed");
    requireTrue(p.saw("lostpointercapture:9"), "lost capture on removal");
    requireTrue(p.unmounted && !p.handle, "unmounted");
    requireTrue(d.capturingElement(9) == kb::kInvalidElement, "capture cleared");
    requireTrue(d.elementCount() == 0, "no elements");
    requireTrue(!d.removeElement(a), "second removal fails");
    requireTrue(d.dispatch(PointerEvent::up(9, 10, 10)) == kb::kInvalidElement, "nobody left to receive");
    std::printf("  Test 6 (removal) PASS\n");
  }

  // --- Test 7: a handler may capture during down and remove itself later ---
  {
    kb::PointerDispatcher d;
    kb::PointerCaptureTarget* handle = nullptr;
    bool captureOk = false;
    kb::ElementId self = kb::kInvalidElement;
    bool removedSelf = false;

    kb::PointerHandlers h;
    h.onMounted = [&](kb::PointerCaptureTarget* t) { handle = t; };
    h.onUnmounted = [&]() { handle = nullptr; };
    h.onPointerDown = [&](const kb::PointerEvent& e) {
      captureOk = handle->setPointerCapture(e.pointerId).ok;
    };
    h.onPointerUp = [&](const kb::PointerEvent&) { removedSelf = d.removeElement(self); };
    self = d.addElement(std::move(h), rect(0, 0, 50, 50));

    d.dispatch(PointerEvent::down(1, PointerButton::Primary, 5, 5));
    requireTrue(captureOk, "capture from inside pointerdown");
    requireTrue(d.dispatch(PointerEvent::up(1, 500, 500)) == self, "up delivered via capture");
    requireTrue(removedSelf, "element removed itself from its handler");
    requireTrue(handle == nullptr && d.elementCount() == 0, "gone");
    std::printf("  Test 7 (re-entrant handlers) PASS\n");
  }

  // --- Test 8: host-supplied lost capture is not routed ---
  {
    kb::PointerDispatcher d;
    Probe p;
    d.addElement(p.handlers(), rect(0, 0, 100, 100));
    requireTrue(d.dispatch(PointerEvent::lostCapture(1)) == kb::kInvalidElement, "ignored");
    requireTrue(p.log.empty(), "nothing delivered");
    std::printf("  Test 8 (host lost capture ignored) PASS\n");
  }

  std::printf("K2.1 pointer dispatcher: ALL PASS\n");
  return 0;
}
