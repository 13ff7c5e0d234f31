#pragma once
#include "kb/drag/DragController.hpp"
#include "kb/drag/Placement.hpp"
#include "kb/ids/Id.hpp"

#include <cstdint>
#include <string>

namespace kb {

using CardId = std::uint32_t;

// Presentational child of a draggable. The drag core never reads it.
struct CardContent {
  std::string title{"card.title"};
  std::string text{"card.text"};
  double width{200.0};
  double height{100.0};
  bool rounded{true};
  bool shadow{true};
};

class Card {
public:
  Card(CardId id, const CardContent& content, const DragConfig& drag);

  CardId id() const { return id_; }
  ElementId elementId() const { return elementId_; }
  const CardContent& content() const { return content_; }

  const Vec2& position() const { return drag_.position(); }
  Placement placement() const { return placementFor(drag_.position()); }
  bool isDragging() const { return drag_.isDragging(); }
  bool isMounted() const { return drag_.isMounted(); }

  // [x, x+width) x [y, y+height) at the current position.
  bool contains(double clientX, double clientY) const;

private:
  friend class Board;

  CardId id_;
  ElementId elementId_{kInvalidElement};
  CardContent content_;
  DragController drag_;
};

} // namespace kb
