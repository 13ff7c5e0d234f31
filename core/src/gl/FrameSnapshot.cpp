#include "kb/gl/FrameSnapshot.hpp"

#include <cstdio>

namespace kb {

const std::uint8_t* FrameSnapshot::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width || y >= height) return nullptr;
  std::size_t row = static_cast<std::size_t>(height - 1 - y);
  std::size_t idx = (row * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
  if (idx + 4 > rgba.size()) return nullptr;
  return &rgba[idx];
}

bool writePPM(const FrameSnapshot& frame, const std::string& path) {
  if (frame.empty()) {
    std::fprintf(stderr, "writePPM: empty frame, nothing written to %s\n", path.c_str());
    return false;
  }
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePPM: cannot open %s\n", path.c_str());
    return false;
  }

  std::fprintf(f, "P6\n%d %d\n255\n", frame.width, frame.height);
  std::vector<std::uint8_t> line(static_cast<std::size_t>(frame.width) * 3);
  for (int y = 0; y < frame.height; y++) {
    for (int x = 0; x < frame.width; x++) {
      const std::uint8_t* p = frame.pixel(x, y);
      line[x * 3 + 0] = p[0];
      line[x * 3 + 1] = p[1];
      line[x * 3 + 2] = p[2];
    }
    std::fwrite(line.data(), 1, line.size(), f);
  }

  bool ok = !std::ferror(f);
  if (std::fclose(f) != 0) ok = false;
  if (!ok) std::fprintf(stderr, "writePPM: write to %s failed\n", path.c_str());
  return ok;
}

} // namespace kb
