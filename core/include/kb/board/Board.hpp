#pragma once
#include "kb/board/BoardConfig.hpp"
#include "kb/board/Card.hpp"
#include "kb/input/PointerDispatcher.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace kb {

// The kanban surface: a set of freely draggable cards.
// Each card gets its own DragController registered with the dispatcher, so
// simultaneous drags on different cards do not interact.
class Board {
public:
  Board(PointerDispatcher& dispatcher, const BoardConfig& config);
  ~Board();

  Board(const Board&) = delete;
  Board& operator=(const Board&) = delete;

  CardId addCard(const CardContent& content, const Vec2& at);
  bool removeCard(CardId id);

  const Card* card(CardId id) const;
  std::size_t cardCount() const { return cards_.size(); }
  std::vector<CardId> cardIds() const;  // paint order, back = topmost

  bool anyDragging() const;

private:
  PointerDispatcher& dispatcher_;
  std::vector<std::unique_ptr<Card>> cards_;
  CardId nextId_{1};
};

} // namespace kb
