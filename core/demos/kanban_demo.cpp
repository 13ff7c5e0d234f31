// Kanban board demo
// GLFW: window with draggable cards (left button drags, focus loss drops capture)
// OSMesa fallback: scripted drag of the top card, writes kanban.ppm
//
// Usage: kanban_demo [config.json]

#include "kb/board/Board.hpp"
#include "kb/board/BoardConfig.hpp"
#include "kb/gl/BoardRenderer.hpp"
#include "kb/gl/FrameSnapshot.hpp"
#include "kb/gl/GlContext.hpp"
#include "kb/input/PointerDispatcher.hpp"
#include "kb/style/Theme.hpp"

#ifdef KB_HAS_GLFW
#include "kb/gl/GlfwContext.hpp"
#endif
#ifdef KB_HAS_OSMESA
#include "kb/gl/OsMesaContext.hpp"
#endif

#include <cstdio>
#include <vector>

#ifdef KB_HAS_GLFW
static int runInteractive(kb::GlfwContext& ctx, kb::PointerDispatcher& dispatcher,
                          kb::Board& board, const kb::Theme& theme) {
  kb::BoardRenderer renderer;
  if (!renderer.init()) return 1;

  std::printf("Drag cards with the left mouse button. Close the window to quit.\n");

  while (!ctx.shouldClose()) {
    kb::HostInput input = ctx.pollInput();
    if (input.shouldClose) break;

    for (const auto& evt : input.events) dispatcher.dispatch(evt);
    if (input.focusLost) dispatcher.revokeAllCaptures();

    int winW = 0, winH = 0;
    ctx.surfaceSize(winW, winH);
    renderer.render(board, theme, winW, winH, ctx.framebufferWidth(), ctx.framebufferHeight());
    ctx.present();
  }
  return 0;
}
#endif

#ifdef KB_HAS_OSMESA
static int runHeadless(kb::GlContext& ctx, kb::PointerDispatcher& dispatcher,
                       kb::Board& board, const kb::Theme& theme) {
  kb::BoardRenderer renderer;
  if (!renderer.init()) return 1;

  // Grab the topmost card near its corner and drag it down-right in steps.
  std::vector<kb::CardId> ids = board.cardIds();
  if (!ids.empty()) {
    const kb::Card* top = board.card(ids.back());
    kb::Vec2 grab = top->position() + kb::Vec2{10.0, 10.0};
    constexpr kb::PointerId kPointer = 1;

    dispatcher.dispatch(kb::PointerEvent::down(kPointer, kb::PointerButton::Primary,
                                               grab.x, grab.y));
    for (int step = 1; step <= 10; step++) {
      dispatcher.dispatch(kb::PointerEvent::move(kPointer, grab.x + step * 30.0,
                                                 grab.y + step * 20.0));
    }
    dispatcher.dispatch(kb::PointerEvent::up(kPointer, grab.x + 300.0, grab.y + 200.0));

    std::printf("Card %u moved to (%.1f, %.1f)\n", static_cast<unsigned>(top->id()),
                top->position().x, top->position().y);
  }

  int surfW = 0, surfH = 0;
  ctx.surfaceSize(surfW, surfH);
  kb::RenderStats stats = renderer.render(board, theme, surfW, surfH,
                                          ctx.framebufferWidth(), ctx.framebufferHeight());
  ctx.present();
  std::printf("Rendered %u cards in %u draw calls\n", stats.cardsDrawn, stats.drawCalls);

  kb::FrameSnapshot frame = ctx.snapshot();
  if (!kb::writePPM(frame, "kanban.ppm")) return 1;
  std::printf("Wrote kanban.ppm (%dx%d)\n", frame.width, frame.height);
  return 0;
}
#endif

int main(int argc, char** argv) {
  kb::BoardConfig config;
  if (argc > 1 && !kb::loadBoardConfigFile(argv[1], config)) {
    return 1;
  }
  kb::Theme theme = kb::themeByName(config.themeName);

  const int W = config.window.width;
  const int H = config.window.height;

#ifdef KB_HAS_GLFW
  {
    kb::GlfwContext glfw("Kanban");
    if (glfw.init(W, H)) {
      kb::PointerDispatcher dispatcher;
      kb::Board board(dispatcher, config);
      return runInteractive(glfw, dispatcher, board, theme);
    }
  }
#endif
#ifdef KB_HAS_OSMESA
  {
    kb::OsMesaContext mesa;
    if (!mesa.init(W, H)) {
      std::fprintf(stderr, "OSMesa init failed\n");
      return 1;
    }
    std::printf("Using OSMesa (headless) - single frame\n");
    kb::PointerDispatcher dispatcher;
    kb::Board board(dispatcher, config);
    return runHeadless(mesa, dispatcher, board, theme);
  }
#endif

  std::fprintf(stderr, "No GL context\n");
  return 1;
}
