#pragma once
#include "kb/board/Board.hpp"
#include "kb/style/Theme.hpp"
#include <glad/gl.h>

namespace kb {

struct RenderStats {
  std::uint32_t cardsDrawn = 0;
  std::uint32_t drawCalls = 0;
};

// Paints the board: background, then every card in paint order
// (shadow, outline, body, title/text placeholder bars).
class BoardRenderer {
public:
  BoardRenderer() = default;
  ~BoardRenderer();

  BoardRenderer(const BoardRenderer&) = delete;
  BoardRenderer& operator=(const BoardRenderer&) = delete;

  // Compile the shader, create the VAO. Call once after GL context is current.
  bool init();

  // surfaceW/H: the coordinate space card positions live in.
  // fbW/H: framebuffer pixels for glViewport.
  RenderStats render(const Board& board, const Theme& theme,
                     int surfaceW, int surfaceH, int fbW, int fbH);

private:
  GLuint program_{0};
  GLuint vao_{0};
  GLint rectLoc_{-1};
  GLint colorLoc_{-1};
  bool inited_{false};

  void fillRect(const Placement& p, double w, double h, const float color[4],
                int surfaceW, int surfaceH, RenderStats& stats);
};

} // namespace kb
