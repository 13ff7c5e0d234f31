#include "kb/board/Board.hpp"

#include <cstdio>

namespace kb {

Board::Board(PointerDispatcher& dispatcher, const BoardConfig& config)
    : dispatcher_(dispatcher) {
  int count = config.cardCount;
  if (count > kMaxCardCount) {
    std::fprintf(stderr, "Board: cardCount %d above limit, creating %d\n", count, kMaxCardCount);
    count = kMaxCardCount;
  }
  for (int i = 0; i < count; i++) {
    Vec2 at = config.initialPosition + config.cascadeOffset * static_cast<double>(i);
    addCard(config.card, at);
  }
}

Board::~Board() {
  while (!cards_.empty()) {
    removeCard(cards_.back()->id());
  }
}

CardId Board::addCard(const CardContent& content, const Vec2& at) {
  DragConfig drag;
  drag.initialPosition = at;
  auto card = std::make_unique<Card>(nextId_++, content, drag);
  Card* c = card.get();
  cards_.push_back(std::move(card));

  PointerHandlers h;
  h.onMounted = [c](PointerCaptureTarget* handle) { c->drag_.onMounted(handle); };
  h.onUnmounted = [c]() { c->drag_.onUnmounted(); };
  h.onPointerDown = [c](const PointerEvent& e) { c->drag_.onPointerDown(e); };
  h.onPointerMove = [c](const PointerEvent& e) { c->drag_.onPointerMove(e); };
  h.onPointerUp = [c](const PointerEvent& e) { c->drag_.onPointerUp(e); };
  h.onPointerCancel = [c](const PointerEvent& e) { c->drag_.onPointerCancel(e); };
  h.onLostPointerCapture = [c](const PointerEvent&) { c->drag_.onLostPointerCapture(); };

  c->elementId_ = dispatcher_.addElement(
    std::move(h), [c](double x, double y) { return c->contains(x, y); });
  return c->id();
}

bool Board::removeCard(CardId id) {
  for (auto it = cards_.begin(); it != cards_.end(); ++it) {
    if ((*it)->id() != id) continue;

    if (!dispatcher_.removeElement((*it)->elementId_)) {
      std::fprintf(stderr, "Board: card %u had no dispatcher element\n",
                   static_cast<unsigned>(id));
    }
    cards_.erase(it);
    return true;
  }
  return false;
}

const Card* Board::card(CardId id) const {
  for (const auto& c : cards_) {
    if (c->id() == id) return c.get();
  }
  return nullptr;
}

std::vector<CardId> Board::cardIds() const {
  std::vector<CardId> ids;
  ids.reserve(cards_.size());
  for (const auto& c : cards_) ids.push_back(c->id());
  return ids;
}

bool Board::anyDragging() const {
  for (const auto& c : cards_) {
    if (c->isDragging()) return true;
  }
  return false;
}

} // namespace kb
