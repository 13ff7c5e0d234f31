#include "kb/board/BoardConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <fstream>
#include <sstream>

namespace kb {

static rapidjson::Value vec2ToJson(const Vec2& v, rapidjson::Document::AllocatorType& alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);
  obj.AddMember("x", v.x, alloc);
  obj.AddMember("y", v.y, alloc);
  return obj;
}

static void readVec2(const rapidjson::Value& parent, const char* key, Vec2& out) {
  if (!parent.HasMember(key) || !parent[key].IsObject()) return;
  const auto& v = parent[key];
  if (v.HasMember("x") && v["x"].IsNumber()) out.x = v["x"].GetDouble();
  if (v.HasMember("y") && v["y"].IsNumber()) out.y = v["y"].GetDouble();
}

std::string serializeBoardConfig(const BoardConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(config.version.c_str(), alloc), alloc);
  doc.AddMember("cardCount", config.cardCount, alloc);
  doc.AddMember("initialPosition", vec2ToJson(config.initialPosition, alloc), alloc);
  doc.AddMember("cascadeOffset", vec2ToJson(config.cascadeOffset, alloc), alloc);

  // Card template
  rapidjson::Value card(rapidjson::kObjectType);
  card.AddMember("title", rapidjson::Value(config.card.title.c_str(), alloc), alloc);
  card.AddMember("text", rapidjson::Value(config.card.text.c_str(), alloc), alloc);
  card.AddMember("width", config.card.width, alloc);
  card.AddMember("height", config.card.height, alloc);
  card.AddMember("rounded", config.card.rounded, alloc);
  card.AddMember("shadow", config.card.shadow, alloc);
  doc.AddMember("card", card, alloc);

  // Window
  rapidjson::Value win(rapidjson::kObjectType);
  win.AddMember("width", config.window.width, alloc);
  win.AddMember("height", config.window.height, alloc);
  doc.AddMember("window", win, alloc);

  doc.AddMember("theme",
                rapidjson::Value(config.themeName.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeBoardConfig(const std::string& json, BoardConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();

  if (doc.HasMember("cardCount") && doc["cardCount"].IsInt()) {
    int n = doc["cardCount"].GetInt();
    if (n >= 0 && n <= kMaxCardCount) out.cardCount = n;
  }

  readVec2(doc, "initialPosition", out.initialPosition);
  readVec2(doc, "cascadeOffset", out.cascadeOffset);

  // Card template
  if (doc.HasMember("card") && doc["card"].IsObject()) {
    const auto& c = doc["card"];
    if (c.HasMember("title") && c["title"].IsString())
      out.card.title = c["title"].GetString();
    if (c.HasMember("text") && c["text"].IsString())
      out.card.text = c["text"].GetString();
    if (c.HasMember("width") && c["width"].IsNumber() && c["width"].GetDouble() > 0)
      out.card.width = c["width"].GetDouble();
    if (c.HasMember("height") && c["height"].IsNumber() && c["height"].GetDouble() > 0)
      out.card.height = c["height"].GetDouble();
    if (c.HasMember("rounded") && c["rounded"].IsBool())
      out.card.rounded = c["rounded"].GetBool();
    if (c.HasMember("shadow") && c["shadow"].IsBool())
      out.card.shadow = c["shadow"].GetBool();
  }

  // Window
  if (doc.HasMember("window") && doc["window"].IsObject()) {
    const auto& w = doc["window"];
    if (w.HasMember("width") && w["width"].IsInt() && w["width"].GetInt() > 0)
      out.window.width = w["width"].GetInt();
    if (w.HasMember("height") && w["height"].IsInt() && w["height"].GetInt() > 0)
      out.window.height = w["height"].GetInt();
  }

  if (doc.HasMember("theme") && doc["theme"].IsString())
    out.themeName = doc["theme"].GetString();

  return true;
}

bool loadBoardConfigFile(const std::string& path, BoardConfig& out) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "BoardConfig: cannot open %s\n", path.c_str());
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();

  if (!deserializeBoardConfig(ss.str(), out)) {
    std::fprintf(stderr, "BoardConfig: %s is not a valid config object\n", path.c_str());
    return false;
  }
  return true;
}

} // namespace kb
