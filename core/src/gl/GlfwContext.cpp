#ifdef KB_HAS_GLFW

#include "kb/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>
#include <utility>

namespace kb {

static PointerButton toPointerButton(int glfwButton) {
  switch (glfwButton) {
    case GLFW_MOUSE_BUTTON_LEFT:   return PointerButton::Primary;
    case GLFW_MOUSE_BUTTON_MIDDLE: return PointerButton::Auxiliary;
    case GLFW_MOUSE_BUTTON_RIGHT:  return PointerButton::Secondary;
    case GLFW_MOUSE_BUTTON_4:      return PointerButton::Back;
    case GLFW_MOUSE_BUTTON_5:      return PointerButton::Forward;
    default:                       return PointerButton::None;
  }
}

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  if (window_) {
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }

  glfwMakeContextCurrent(window_);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetWindowFocusCallback(window_, focusCallback);

  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);

  return true;
}

void GlfwContext::present() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

FrameSnapshot GlfwContext::snapshot() const {
  FrameSnapshot frame;
  if (!window_ || width_ <= 0 || height_ <= 0) return frame;
  frame.width = width_;
  frame.height = height_;
  frame.rgba.resize(static_cast<std::size_t>(width_) * height_ * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadBuffer(GL_FRONT);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, frame.rgba.data());
  return frame;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

void GlfwContext::surfaceSize(int& w, int& h) const {
  w = width_;
  h = height_;
  if (window_) glfwGetWindowSize(window_, &w, &h);
}

HostInput GlfwContext::pollInput() {
  glfwPollEvents();

  if (window_) {
    glfwGetFramebufferSize(window_, &width_, &height_);
  }

  HostInput input;
  input.events = std::move(pending_);
  input.focusLost = focusLost_;
  input.shouldClose = shouldClose();

  pending_.clear();
  focusLost_ = false;
  return input;
}

// Cursor coordinates are window coordinates; the board works in the same
// space, so no framebuffer scaling is applied here.
void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->lastCursorX_ = x;
  self->lastCursorY_ = y;
  self->pending_.push_back(PointerEvent::move(kMousePointerId, x, y));
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  PointerButton b = toPointerButton(button);
  if (action == GLFW_PRESS) {
    self->pending_.push_back(self->buttons_.press(b, self->lastCursorX_, self->lastCursorY_));
  } else if (action == GLFW_RELEASE) {
    self->pending_.push_back(self->buttons_.release(b, self->lastCursorX_, self->lastCursorY_));
  }
}

void GlfwContext::focusCallback(GLFWwindow* w, int focused) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || focused) return;
  self->focusLost_ = true;
  self->buttons_.reset();
}

} // namespace kb

#endif // KB_HAS_GLFW
