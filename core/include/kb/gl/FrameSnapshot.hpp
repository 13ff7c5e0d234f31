#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace kb {

// RGBA copy of a rendered frame. Rows are stored bottom row first, the order
// glReadPixels and OSMesa use.
struct FrameSnapshot {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;

  bool empty() const { return width <= 0 || height <= 0 || rgba.empty(); }

  // Pixel at surface coordinates (x right, y down); nullptr outside the frame.
  const std::uint8_t* pixel(int x, int y) const;
};

// Write the frame as a binary PPM (P6), top row first. Returns false and
// logs if the file cannot be written.
bool writePPM(const FrameSnapshot& frame, const std::string& path);

} // namespace kb
