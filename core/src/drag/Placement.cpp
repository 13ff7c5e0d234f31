#include "kb/drag/Placement.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace kb {

// Shortest decimal that parses back to the same double: "100", "15.5", "-2".
static std::string formatPx(double v) {
  if (v == 0.0) return "0";  // also folds -0
  char buf[32];
  for (int prec = 1; prec <= 17; prec++) {
    std::snprintf(buf, sizeof(buf), "%.*g", prec, v);
    if (!std::strchr(buf, 'e') && std::strtod(buf, nullptr) == v) return buf;
  }
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  return buf;
}

Placement placementFor(const Vec2& position, const Vec2& origin) {
  return {origin.x + position.x, origin.y + position.y};
}

std::string absoluteStyle(const Placement& p) {
  return "position:absolute; left:" + formatPx(p.left) +
         "px; top:" + formatPx(p.top) + "px;";
}

ClipRect placementClipRect(const Placement& p, double width, double height,
                           int fbWidth, int fbHeight) {
  ClipRect r;
  if (fbWidth <= 0 || fbHeight <= 0) return r;

  // Pixel Y grows downward, clip Y grows upward.
  double x0 = p.left / fbWidth * 2.0 - 1.0;
  double x1 = (p.left + width) / fbWidth * 2.0 - 1.0;
  double y0 = 1.0 - (p.top + height) / fbHeight * 2.0;
  double y1 = 1.0 - p.top / fbHeight * 2.0;

  r.x0 = static_cast<float>(x0);
  r.y0 = static_cast<float>(y0);
  r.x1 = static_cast<float>(x1);
  r.y1 = static_cast<float>(y1);
  return r;
}

} // namespace kb
