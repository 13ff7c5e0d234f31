#include "kb/gl/BoardRenderer.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace kb {

// Expands gl_VertexID 0..5 into two triangles covering u_rect (x0,y0,x1,y1).
static const char* kRectVert = R"GLSL(
#version 330 core
uniform vec4 u_rect;
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    gl_Position = vec4(mix(u_rect.xy, u_rect.zw, uv), 0.0, 1.0);
}
)GLSL";

static const char* kRectFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

static constexpr double kBorderPx = 1.0;
static constexpr double kHighlightPx = 2.0;
static constexpr double kShadowPx = 3.0;
static constexpr double kPaddingPx = 16.0;  // p-4

static GLuint compileShader(GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(std::max(len, 1)));
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "BoardRenderer: shader compile error:\n%s\n", log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

BoardRenderer::~BoardRenderer() {
  if (program_) glDeleteProgram(program_);
  if (vao_) glDeleteVertexArrays(1, &vao_);
}

bool BoardRenderer::init() {
  GLuint vs = compileShader(GL_VERTEX_SHADER, kRectVert);
  if (!vs) return false;

  GLuint fs = compileShader(GL_FRAGMENT_SHADER, kRectFrag);
  if (!fs) { glDeleteShader(vs); return false; }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    std::fprintf(stderr, "BoardRenderer: program link failed\n");
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }

  rectLoc_ = glGetUniformLocation(program_, "u_rect");
  colorLoc_ = glGetUniformLocation(program_, "u_color");

  // Core profile needs a bound VAO even with no attributes.
  glGenVertexArrays(1, &vao_);

  inited_ = true;
  return true;
}

void BoardRenderer::fillRect(const Placement& p, double w, double h, const float color[4],
                             int surfaceW, int surfaceH, RenderStats& stats) {
  if (w <= 0 || h <= 0) return;
  ClipRect r = placementClipRect(p, w, h, surfaceW, surfaceH);
  glUniform4f(rectLoc_, r.x0, r.y0, r.x1, r.y1);
  glUniform4f(colorLoc_, color[0], color[1], color[2], color[3]);
  glDrawArrays(GL_TRIANGLES, 0, 6);
  stats.drawCalls++;
}

RenderStats BoardRenderer::render(const Board& board, const Theme& theme,
                                  int surfaceW, int surfaceH, int fbW, int fbH) {
  RenderStats stats;
  if (!inited_) return stats;

  glViewport(0, 0, fbW, fbH);
  const float* bg = theme.backgroundColor;
  glClearColor(bg[0], bg[1], bg[2], bg[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  glUseProgram(program_);
  glBindVertexArray(vao_);

  for (CardId id : board.cardIds()) {
    const Card* card = board.card(id);
    if (!card) continue;

    const CardContent& c = card->content();
    Placement p = card->placement();

    if (c.shadow) {
      fillRect({p.left + kShadowPx, p.top + kShadowPx}, c.width, c.height,
               theme.cardShadowColor, surfaceW, surfaceH, stats);
    }

    double edge = card->isDragging() ? kHighlightPx : kBorderPx;
    const float* outline = card->isDragging() ? theme.dragHighlightColor
                                              : theme.cardBorderColor;
    fillRect(p, c.width, c.height, outline, surfaceW, surfaceH, stats);
    fillRect({p.left + edge, p.top + edge}, c.width - 2 * edge, c.height - 2 * edge,
             theme.cardColor, surfaceW, surfaceH, stats);

    // Typography stand-ins: one bar per line, width follows the string length.
    double inner = c.width - 2 * kPaddingPx;
    double titleW = std::min(inner, 10.0 * static_cast<double>(c.title.size()));
    double textW = std::min(inner, 7.0 * static_cast<double>(c.text.size()));
    fillRect({p.left + kPaddingPx, p.top + kPaddingPx + 8.0}, titleW, 12.0,
             theme.titleBarColor, surfaceW, surfaceH, stats);
    fillRect({p.left + kPaddingPx, p.top + kPaddingPx + 36.0}, textW, 8.0,
             theme.textBarColor, surfaceW, surfaceH, stats);

    stats.cardsDrawn++;
  }

  glBindVertexArray(0);
  return stats;
}

} // namespace kb
