#pragma once
#include "kb/ids/Id.hpp"
#include "kb/input/PointerCapture.hpp"
#include "kb/input/PointerEvent.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kb {

// Returns true if the element covers the given client point.
using HitTestFn = std::function<bool(double clientX, double clientY)>;

// Handler functions an element registers. Empty functions are skipped.
struct PointerHandlers {
  std::function<void(PointerCaptureTarget*)> onMounted;
  std::function<void()> onUnmounted;

  std::function<void(const PointerEvent&)> onPointerDown;
  std::function<void(const PointerEvent&)> onPointerMove;
  std::function<void(const PointerEvent&)> onPointerUp;
  std::function<void(const PointerEvent&)> onPointerCancel;
  std::function<void(const PointerEvent&)> onLostPointerCapture;
};

// Host UI layer: routes pointer events to registered elements and owns the
// pointer-capture bookkeeping.
//
// Routing: a captured pointer goes to its capturing element; otherwise to the
// topmost (most recently added) element whose hit test accepts the point.
// Capture is dropped implicitly after Up/Cancel, on removal, and on revoke;
// each drop delivers LostCapture to the element that held it.
//
// Single-threaded. Handlers may call back into the dispatcher.
class PointerDispatcher {
public:
  PointerDispatcher();
  ~PointerDispatcher();

  PointerDispatcher(const PointerDispatcher&) = delete;
  PointerDispatcher& operator=(const PointerDispatcher&) = delete;

  // onMounted is invoked before this returns.
  ElementId addElement(PointerHandlers handlers, HitTestFn hitTest);
  bool removeElement(ElementId id);
  std::size_t elementCount() const { return elements_.size(); }

  // Returns the element the event was delivered to, or kInvalidElement.
  ElementId dispatch(const PointerEvent& evt);

  ElementId hitTest(double clientX, double clientY) const;

  // Out-of-band capture loss (focus change, another UI grabbing input).
  void revokeCapture(PointerId id);
  void revokeAllCaptures();

  ElementId capturingElement(PointerId id) const;
  bool isPointerActive(PointerId id) const;

private:
  class ElementHandle;
  friend class ElementHandle;

  struct Element {
    ElementId id{kInvalidElement};
    PointerHandlers handlers;
    HitTestFn hitTest;
    std::unique_ptr<ElementHandle> handle;
  };

  std::vector<Element> elements_;  // paint order, back = topmost
  std::unordered_map<PointerId, ElementId> captures_;
  std::unordered_set<PointerId> activePointers_;
  ElementId nextId_{1};

  const Element* find(ElementId id) const;

  CaptureResult capture(ElementId el, PointerId id);
  CaptureResult release(ElementId el, PointerId id);
  bool holdsCapture(ElementId el, PointerId id) const;

  void deliver(ElementId el, const PointerEvent& evt);
  void deliverLostCapture(const PointerHandlers& handlers, PointerId id);
};

} // namespace kb
