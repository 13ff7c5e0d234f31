#pragma once
#include "kb/gl/GlContext.hpp"

#ifdef KB_HAS_OSMESA

#include <glad/gl.h>    // before osmesa.h, which would pull in GL/gl.h

#ifndef APIENTRY
#define APIENTRY
#endif
#ifndef GLAPI
#define GLAPI extern
#endif

#include <GL/osmesa.h>
#include <cstdint>
#include <vector>

namespace kb {

// Offscreen board surface. Frames are rendered straight into a client-side
// RGBA buffer, so snapshot() is a copy rather than a GL readback.
class OsMesaContext : public GlContext {
public:
  OsMesaContext() = default;
  ~OsMesaContext() override;

  OsMesaContext(const OsMesaContext&) = delete;
  OsMesaContext& operator=(const OsMesaContext&) = delete;

  bool init(int width, int height) override;
  void present() override;

  int framebufferWidth() const override { return frame_.width; }
  int framebufferHeight() const override { return frame_.height; }

  FrameSnapshot snapshot() const override { return frame_; }

private:
  bool fail(const char* what);

  OSMesaContext ctx_{nullptr};
  FrameSnapshot frame_;
};

} // namespace kb

#endif // KB_HAS_OSMESA
