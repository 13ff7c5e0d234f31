#pragma once
#include "kb/board/Card.hpp"
#include "kb/math/Vec2.hpp"

#include <string>

namespace kb {

struct WindowConfig {
  int width{1024};
  int height{768};
};

// Largest cardCount a config may ask for.
constexpr int kMaxCardCount = 1000;

// Serializable board configuration. Card positions are not part of it.
struct BoardConfig {
  std::string version{"1.0"};
  int cardCount{5};
  Vec2 initialPosition{100.0, 100.0};
  Vec2 cascadeOffset{0.0, 0.0};   // card i starts at initialPosition + i * cascadeOffset
  CardContent card;               // template for every card
  WindowConfig window;
  std::string themeName{"Light"}; // "Light" or "Dark"
};

// Serialize BoardConfig to a JSON string.
std::string serializeBoardConfig(const BoardConfig& config);

// Deserialize a JSON string into BoardConfig. Returns false on error.
// Missing or mistyped members keep the values already in `out`.
bool deserializeBoardConfig(const std::string& json, BoardConfig& out);

// Read and deserialize a config file. Returns false if unreadable or invalid.
bool loadBoardConfigFile(const std::string& path, BoardConfig& out);

} // namespace kb
