#pragma once
#include "kb/gl/GlContext.hpp"
#include "kb/input/MouseButtons.hpp"

#ifdef KB_HAS_GLFW

#include <string>
#include <vector>

struct GLFWwindow;

namespace kb {

// What happened since the last poll, in delivery order.
struct HostInput {
  std::vector<PointerEvent> events;
  bool focusLost{false};   // host revoked input focus; captures should be dropped
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  // The mouse is reported as a single pointer with this id.
  static constexpr PointerId kMousePointerId = 1;

  explicit GlfwContext(std::string title = "Kanban");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void present() override;

  int framebufferWidth() const override { return width_; }
  int framebufferHeight() const override { return height_; }

  // Window size in screen coordinates, the space pointer events use.
  void surfaceSize(int& w, int& h) const override;

  FrameSnapshot snapshot() const override;

  HostInput pollInput();
  bool shouldClose() const;

private:
  std::string title_;
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};

  // Accumulated by callbacks, drained by pollInput()
  std::vector<PointerEvent> pending_;
  double lastCursorX_{0};
  double lastCursorY_{0};
  MouseButtonTracker buttons_{kMousePointerId};
  bool focusLost_{false};

  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void focusCallback(GLFWwindow* w, int focused);
};

} // namespace kb

#endif // KB_HAS_GLFW
