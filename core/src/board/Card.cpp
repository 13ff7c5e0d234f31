#include "kb/board/Card.hpp"

namespace kb {

Card::Card(CardId id, const CardContent& content, const DragConfig& drag)
    : id_(id), content_(content), drag_(drag) {}

bool Card::contains(double clientX, double clientY) const {
  const Vec2& p = drag_.position();
  return clientX >= p.x && clientX < p.x + content_.width &&
         clientY >= p.y && clientY < p.y + content_.height;
}

} // namespace kb
