#include "kb/style/Theme.hpp"

#include <cstdio>

namespace kb {

static void setColor(float dst[4], float r, float g, float b, float a) {
  dst[0] = r; dst[1] = g; dst[2] = b; dst[3] = a;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";
  return t;
}

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  setColor(t.backgroundColor, 0.059f, 0.090f, 0.165f, 1.0f);
  setColor(t.cardColor, 0.118f, 0.161f, 0.231f, 1.0f);
  setColor(t.cardBorderColor, 0.200f, 0.255f, 0.333f, 1.0f);
  setColor(t.cardShadowColor, 0.0f, 0.0f, 0.0f, 0.35f);
  setColor(t.titleBarColor, 0.886f, 0.910f, 0.941f, 1.0f);
  setColor(t.textBarColor, 0.580f, 0.639f, 0.722f, 1.0f);
  setColor(t.dragHighlightColor, 0.376f, 0.647f, 0.980f, 1.0f);
  return t;
}

Theme themeByName(const std::string& name) {
  if (name == "Dark") return darkTheme();
  if (name != "Light" && !name.empty()) {
    std::fprintf(stderr, "Theme: unknown theme '%s', using Light\n", name.c_str());
  }
  return lightTheme();
}

} // namespace kb
