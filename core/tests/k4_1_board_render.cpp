// K4.1 - BoardRenderer (OSMesa)
// Renders one card, drags it, renders again: pixels follow the card.
// The last frame is written as a PPM and its header checked.

#include "kb/board/Board.hpp"
#include "kb/gl/BoardRenderer.hpp"
#include "kb/gl/OsMesaContext.hpp"
#include "kb/style/Theme.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool isCardWhite(const std::uint8_t* p) {
  return p && p[0] >= 253 && p[1] >= 253 && p[2] >= 253;
}

int main() {
  constexpr int W = 320;
  constexpr int H = 240;

  kb::OsMesaContext ctx;
  if (!ctx.init(W, H)) {
    std::fprintf(stderr, "Could not init OSMesa - skipping test\n");
    return 0; // graceful skip
  }

  kb::BoardRenderer renderer;
  requireTrue(renderer.init(), "BoardRenderer::init");

  kb::BoardConfig cfg;
  cfg.cardCount = 1;
  cfg.initialPosition = {20, 20};
  cfg.card.width = 100;
  cfg.card.height = 60;
  cfg.card.title = "";
  cfg.card.text = "";

  kb::PointerDispatcher d;
  kb::Board board(d, cfg);
  kb::Theme theme = kb::lightTheme();

  // --- Frame 1: card at (20,20) ---
  kb::RenderStats s1 = renderer.render(board, theme, W, H, W, H);
  ctx.present();
  requireTrue(s1.cardsDrawn == 1, "one card drawn");
  requireTrue(s1.drawCalls > 0, "draw calls issued");

  kb::FrameSnapshot frame = ctx.snapshot();
  requireTrue(frame.width == W && frame.height == H, "snapshot size");
  requireTrue(frame.pixel(W, 0) == nullptr && frame.pixel(0, -1) == nullptr,
              "no pixel outside the frame");
  requireTrue(isCardWhite(frame.pixel(70, 50)), "card body at original position");
  requireTrue(!isCardWhite(frame.pixel(220, 170)), "background where card will go");
  std::printf("  Frame 1 PASS\n");

  // --- Drag by (+150, +120) ---
  d.dispatch(kb::PointerEvent::down(1, kb::PointerButton::Primary, 30, 30));
  d.dispatch(kb::PointerEvent::move(1, 180, 150));
  d.dispatch(kb::PointerEvent::up(1, 180, 150));

  renderer.render(board, theme, W, H, W, H);
  ctx.present();
  frame = ctx.snapshot();
  requireTrue(isCardWhite(frame.pixel(220, 170)), "card body at new position");
  requireTrue(!isCardWhite(frame.pixel(70, 50)), "old position cleared");
  std::printf("  Frame 2 PASS\n");

  // --- PPM snapshot: header then W*H RGB triples, top row first ---
  const char* path = "k4_1_board_render.ppm";
  requireTrue(kb::writePPM(frame, path), "writePPM");
  FILE* f = std::fopen(path, "rb");
  requireTrue(f != nullptr, "PPM readable");
  char magic[3] = {0};
  int pw = 0, ph = 0, maxVal = 0;
  requireTrue(std::fscanf(f, "%2s %d %d %d", magic, &pw, &ph, &maxVal) == 4, "PPM header");
  requireTrue(std::string(magic) == "P6" && pw == W && ph == H && maxVal == 255,
              "PPM header values");
  std::fgetc(f);  // single whitespace before the raster
  std::vector<unsigned char> raster(static_cast<std::size_t>(W) * H * 3);
  requireTrue(std::fread(raster.data(), 1, raster.size(), f) == raster.size(), "PPM raster");
  std::fclose(f);
  std::remove(path);
  const unsigned char* rgb = &raster[(static_cast<std::size_t>(170) * W + 220) * 3];
  requireTrue(rgb[0] >= 253 && rgb[1] >= 253 && rgb[2] >= 253, "PPM rows are top first");
  requireTrue(!kb::writePPM(kb::FrameSnapshot{}, path), "empty frame refused");
  std::printf("  PPM PASS\n");

  std::printf("K4.1 board render: ALL PASS\n");
  return 0;
}
