#pragma once
#include <string>

namespace kb {

struct Theme {
  std::string name;

  // Surface
  float backgroundColor[4] = {0.945f, 0.961f, 0.976f, 1.0f};

  // Card body, outline and drop shadow
  float cardColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float cardBorderColor[4] = {0.886f, 0.910f, 0.941f, 1.0f};
  float cardShadowColor[4] = {0.0f, 0.0f, 0.0f, 0.08f};

  // Placeholder bars standing in for the title and body text
  float titleBarColor[4] = {0.118f, 0.161f, 0.231f, 1.0f};
  float textBarColor[4] = {0.278f, 0.333f, 0.412f, 1.0f};

  // Outline of a card while it is being dragged
  float dragHighlightColor[4] = {0.231f, 0.510f, 0.965f, 1.0f};
};

// Built-in presets
Theme lightTheme();
Theme darkTheme();

// Preset by name ("Light", "Dark"); unknown names fall back to light.
Theme themeByName(const std::string& name);

} // namespace kb
