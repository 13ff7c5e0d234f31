#pragma once
#include "kb/math/Vec2.hpp"
#include <string>

namespace kb {

// Absolute placement of a draggable's visual subtree, in surface pixels
// (0=left/top).
struct Placement {
  double left{0}, top{0};
};

// Clip-space rectangle (y up), ready for a GL draw.
struct ClipRect {
  float x0{0}, y0{0}, x1{0}, y1{0};
};

Placement placementFor(const Vec2& position, const Vec2& origin = {});

// "position:absolute; left:<left>px; top:<top>px;"
std::string absoluteStyle(const Placement& p);

ClipRect placementClipRect(const Placement& p, double width, double height,
                           int fbWidth, int fbHeight);

} // namespace kb
