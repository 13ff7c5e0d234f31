#pragma once
#include "kb/gl/FrameSnapshot.hpp"

namespace kb {

// A GL 3.3 core context the board is painted into.
class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;

  // End the frame: swap for a window, finish for an offscreen buffer.
  virtual void present() = 0;

  // Drawable size in pixels.
  virtual int framebufferWidth() const = 0;
  virtual int framebufferHeight() const = 0;

  // Size of the surface pointer coordinates are given in. Equal to the
  // framebuffer size unless the host scales (HiDPI windows).
  virtual void surfaceSize(int& w, int& h) const {
    w = framebufferWidth();
    h = framebufferHeight();
  }

  // Copy of the last presented frame.
  virtual FrameSnapshot snapshot() const = 0;
};

} // namespace kb
