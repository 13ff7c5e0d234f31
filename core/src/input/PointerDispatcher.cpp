#include "kb/input/PointerDispatcher.hpp"

#include <string>
#include <utility>

namespace kb {

// ---- ElementHandle ----

class PointerDispatcher::ElementHandle : public PointerCaptureTarget {
public:
  ElementHandle(PointerDispatcher& owner, ElementId id) : owner_(owner), id_(id) {}

  CaptureResult setPointerCapture(PointerId id) override {
    if (!owner_.find(id_))
      return CaptureResult::failure("InvalidStateError", "element is not connected");
    return owner_.capture(id_, id);
  }

  CaptureResult releasePointerCapture(PointerId id) override {
    if (!owner_.find(id_))
      return CaptureResult::failure("InvalidStateError", "element is not connected");
    return owner_.release(id_, id);
  }

  bool hasPointerCapture(PointerId id) const override {
    return owner_.holdsCapture(id_, id);
  }

private:
  PointerDispatcher& owner_;
  ElementId id_;
};

// ---- PointerDispatcher ----

PointerDispatcher::PointerDispatcher() = default;

PointerDispatcher::~PointerDispatcher() = default;

ElementId PointerDispatcher::addElement(PointerHandlers handlers, HitTestFn hitTest) {
  Element el;
  el.id = nextId_++;
  el.handlers = std::move(handlers);
  el.hitTest = std::move(hitTest);
  el.handle = std::make_unique<ElementHandle>(*this, el.id);

  ElementId id = el.id;
  PointerCaptureTarget* handle = el.handle.get();
  auto onMounted = el.handlers.onMounted;
  elements_.push_back(std::move(el));

  if (onMounted) onMounted(handle);
  return id;
}

bool PointerDispatcher::removeElement(ElementId id) {
  auto it = elements_.begin();
  for (; it != elements_.end(); ++it) {
    if (it->id == id) break;
  }
  if (it == elements_.end()) return false;

  Element removed = std::move(*it);
  elements_.erase(it);

  std::vector<PointerId> lost;
  for (auto c = captures_.begin(); c != captures_.end();) {
    if (c->second == id) {
      lost.push_back(c->first);
      c = captures_.erase(c);
    } else {
      ++c;
    }
  }
  for (PointerId p : lost) deliverLostCapture(removed.handlers, p);

  if (removed.handlers.onUnmounted) removed.handlers.onUnmounted();
  return true;
}

ElementId PointerDispatcher::hitTest(double clientX, double clientY) const {
  for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
    if (it->hitTest && it->hitTest(clientX, clientY)) return it->id;
  }
  return kInvalidElement;
}

ElementId PointerDispatcher::dispatch(const PointerEvent& evt) {
  // Capture loss is produced here, never taken from the host stream.
  if (evt.kind == PointerEventKind::LostCapture) return kInvalidElement;

  if (evt.kind == PointerEventKind::Down) activePointers_.insert(evt.pointerId);

  ElementId target = capturingElement(evt.pointerId);
  if (target == kInvalidElement) target = hitTest(evt.clientX, evt.clientY);
  if (target != kInvalidElement) deliver(target, evt);

  if (evt.kind == PointerEventKind::Up || evt.kind == PointerEventKind::Cancel) {
    activePointers_.erase(evt.pointerId);
    revokeCapture(evt.pointerId);
  }
  return target;
}

void PointerDispatcher::revokeCapture(PointerId id) {
  auto it = captures_.find(id);
  if (it == captures_.end()) return;

  ElementId holder = it->second;
  captures_.erase(it);
  if (const Element* el = find(holder)) {
    PointerHandlers handlers = el->handlers;
    deliverLostCapture(handlers, id);
  }
}

void PointerDispatcher::revokeAllCaptures() {
  auto lost = std::move(captures_);
  captures_.clear();
  for (const auto& c : lost) {
    if (const Element* el = find(c.second)) {
      PointerHandlers handlers = el->handlers;
      deliverLostCapture(handlers, c.first);
    }
  }
}

ElementId PointerDispatcher::capturingElement(PointerId id) const {
  auto it = captures_.find(id);
  return it == captures_.end() ? kInvalidElement : it->second;
}

bool PointerDispatcher::isPointerActive(PointerId id) const {
  return activePointers_.count(id) != 0;
}

const PointerDispatcher::Element* PointerDispatcher::find(ElementId id) const {
  for (const auto& el : elements_) {
    if (el.id == id) return &el;
  }
  return nullptr;
}

CaptureResult PointerDispatcher::capture(ElementId el, PointerId id) {
  if (!isPointerActive(id))
    return CaptureResult::failure("NotFoundError",
                                  "no active pointer with id " + std::to_string(id));

  ElementId previous = capturingElement(id);
  if (previous == el) return CaptureResult::success();

  captures_[id] = el;
  if (previous != kInvalidElement) {
    if (const Element* prev = find(previous)) {
      PointerHandlers handlers = prev->handlers;
      deliverLostCapture(handlers, id);
    }
  }
  return CaptureResult::success();
}

CaptureResult PointerDispatcher::release(ElementId el, PointerId id) {
  if (!isPointerActive(id))
    return CaptureResult::failure("NotFoundError",
                                  "no active pointer with id " + std::to_string(id));
  if (!holdsCapture(el, id)) return CaptureResult::success();

  captures_.erase(id);
  if (const Element* e = find(el)) {
    PointerHandlers handlers = e->handlers;
    deliverLostCapture(handlers, id);
  }
  return CaptureResult::success();
}

bool PointerDispatcher::holdsCapture(ElementId el, PointerId id) const {
  return capturingElement(id) == el;
}

void PointerDispatcher::deliver(ElementId el, const PointerEvent& evt) {
  const Element* e = find(el);
  if (!e) return;

  // Copy: the handler may add or remove elements.
  std::function<void(const PointerEvent&)> fn;
  switch (evt.kind) {
    case PointerEventKind::Down:        fn = e->handlers.onPointerDown; break;
    case PointerEventKind::Move:        fn = e->handlers.onPointerMove; break;
    case PointerEventKind::Up:          fn = e->handlers.onPointerUp; break;
    case PointerEventKind::Cancel:      fn = e->handlers.onPointerCancel; break;
    case PointerEventKind::LostCapture: fn = e->handlers.onLostPointerCapture; break;
  }
  if (fn) fn(evt);
}

void PointerDispatcher::deliverLostCapture(const PointerHandlers& handlers, PointerId id) {
  if (handlers.onLostPointerCapture)
    handlers.onLostPointerCapture(PointerEvent::lostCapture(id));
}

} // namespace kb
