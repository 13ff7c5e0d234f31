#ifdef KB_HAS_OSMESA

#include "kb/gl/OsMesaContext.hpp"
#include <cstdio>

namespace kb {

OsMesaContext::~OsMesaContext() {
  if (ctx_) OSMesaDestroyContext(ctx_);
}

bool OsMesaContext::fail(const char* what) {
  std::fprintf(stderr, "OsMesaContext: %s failed\n", what);
  if (ctx_) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
  }
  frame_ = FrameSnapshot{};
  return false;
}

bool OsMesaContext::init(int width, int height) {
  if (ctx_) return fail("re-init");
  if (width <= 0 || height <= 0) return fail("init with an empty surface");

  // Cards are flat rectangles painted in order: no depth or stencil needed.
  const int attribs[] = {
    OSMESA_FORMAT, OSMESA_RGBA,
    OSMESA_DEPTH_BITS, 0,
    OSMESA_STENCIL_BITS, 0,
    OSMESA_PROFILE, OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };
  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) return fail("OSMesaCreateContextAttribs");

  frame_.width = width;
  frame_.height = height;
  frame_.rgba.assign(static_cast<std::size_t>(width) * height * 4, 0);

  if (!OSMesaMakeCurrent(ctx_, frame_.rgba.data(), GL_UNSIGNED_BYTE, width, height))
    return fail("OSMesaMakeCurrent");
  if (!gladLoadGL((GLADloadfunc)OSMesaGetProcAddress))
    return fail("gladLoadGL");
  return true;
}

void OsMesaContext::present() {
  if (ctx_) glFinish();
}

} // namespace kb

#endif // KB_HAS_OSMESA
