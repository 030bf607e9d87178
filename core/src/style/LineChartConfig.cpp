#include "ac/style/LineChartConfig.hpp"

#include <cstdio>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace ac {

// -------------------- Built-in presets --------------------

LineChartConfig plainLineChartConfig() {
  LineChartConfig c;
  c.name = "Plain";
  // All fields already carry the plain defaults from the struct initializers.
  return c;
}

LineChartConfig defaultLineChartConfig() {
  LineChartConfig c;
  c.name = "Default";

  c.showsVerticalGridLines = false;
  c.padding = EdgeInsets{0.0, 0.0, 0.0, 0.0};

  c.horizontalLabels.fontSize = 13.0;
  c.verticalLabels.fontSize = 14.0;

  c.horizontalLabels.color[0] = 0.682f; c.horizontalLabels.color[1] = 0.682f;
  c.horizontalLabels.color[2] = 0.698f; c.horizontalLabels.color[3] = 1.0f;

  c.verticalLabels.color[0] = 0.682f; c.verticalLabels.color[1] = 0.682f;
  c.verticalLabels.color[2] = 0.698f; c.verticalLabels.color[3] = 1.0f;

  c.lineWidth = 3.5;

  c.hoverLineColor[0] = 0.333f; c.hoverLineColor[1] = 0.333f;
  c.hoverLineColor[2] = 0.333f; c.hoverLineColor[3] = 1.0f;

  return c;
}

// -------------------- JSON readers --------------------

static void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsNumber()) out = it->value.GetDouble();
}

static void readInt(const rapidjson::Value& obj, const char* key, int& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsInt()) out = it->value.GetInt();
}

static void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsBool()) out = it->value.GetBool();
}

static void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsString()) out = it->value.GetString();
}

// Colors are [r, g, b, a] arrays; anything else is ignored.
static void readColor(const rapidjson::Value& obj, const char* key, float out[4]) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsArray() || it->value.Size() != 4) return;
  const auto& arr = it->value;
  for (rapidjson::SizeType i = 0; i < 4; i++) {
    if (!arr[i].IsNumber()) return;
  }
  for (rapidjson::SizeType i = 0; i < 4; i++) {
    out[i] = static_cast<float>(arr[i].GetDouble());
  }
}

static const rapidjson::Value* findObject(const rapidjson::Value& obj, const char* key) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsObject()) return nullptr;
  return &it->value;
}

static void readGrid(const rapidjson::Value& obj, const char* key, GridLineStyle& out) {
  const rapidjson::Value* g = findObject(obj, key);
  if (!g) return;
  readColor(*g, "color", out.color);
  readDouble(*g, "lineWidth", out.lineWidth);
}

static void readLabels(const rapidjson::Value& obj, const char* key, AxisLabelStyle& out) {
  const rapidjson::Value* l = findObject(obj, key);
  if (!l) return;
  readDouble(*l, "fontSize", out.fontSize);
  readColor(*l, "color", out.color);
}

bool loadLineChartConfig(const std::string& json, LineChartConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    std::fprintf(stderr, "LineChartConfig: parse error at %u: %s\n",
                 static_cast<unsigned>(doc.GetErrorOffset()),
                 rapidjson::GetParseError_En(doc.GetParseError()));
    return false;
  }
  if (!doc.IsObject()) {
    std::fprintf(stderr, "LineChartConfig: top-level value is not an object\n");
    return false;
  }

  readString(doc, "name", out.name);
  readDouble(doc, "lineWidth", out.lineWidth);
  readColor(doc, "tintColor", out.tintColor);
  readColor(doc, "hoverLineColor", out.hoverLineColor);

  if (const rapidjson::Value* p = findObject(doc, "padding")) {
    readDouble(*p, "top", out.padding.top);
    readDouble(*p, "left", out.padding.left);
    readDouble(*p, "bottom", out.padding.bottom);
    readDouble(*p, "right", out.padding.right);
  }
  readDouble(doc, "horizontalLabelsToTopPadding", out.horizontalLabelsToTopPadding);

  readInt(doc, "verticalDivisions", out.verticalDivisions);
  readDouble(doc, "verticalGridSpacing", out.verticalGridSpacing);
  readColor(doc, "cursorColor", out.cursorColor);

  readBool(doc, "showsHorizontalGridLines", out.showsHorizontalGridLines);
  readBool(doc, "showsVerticalGridLines", out.showsVerticalGridLines);
  readBool(doc, "showsCursor", out.showsCursor);

  readGrid(doc, "horizontalGrid", out.horizontalGrid);
  readGrid(doc, "verticalGrid", out.verticalGrid);
  readLabels(doc, "horizontalLabels", out.horizontalLabels);
  readLabels(doc, "verticalLabels", out.verticalLabels);

  if (const rapidjson::Value* d = findObject(doc, "dot")) {
    readDouble(*d, "size", out.dot.size);
    readColor(*d, "color", out.dot.color);
    readColor(*d, "strokeColor", out.dot.strokeColor);
    readDouble(*d, "strokeWidth", out.dot.strokeWidth);
  }
  if (const rapidjson::Value* c = findObject(doc, "cursorLabel")) {
    readDouble(*c, "fontSize", out.cursorLabel.fontSize);
    readColor(*c, "backgroundColor", out.cursorLabel.backgroundColor);
    readColor(*c, "foregroundColor", out.cursorLabel.foregroundColor);
  }

  readString(doc, "dateFormat", out.dateFormat);
  readBool(doc, "dateUseUTC", out.dateUseUTC);
  readDouble(doc, "animationDuration", out.animationDuration);
  readDouble(doc, "xLabelSpacing", out.xLabelSpacing);
  readDouble(doc, "tooltipHorizontalInset", out.tooltipHorizontalInset);

  if (out.verticalDivisions < 2) {
    std::fprintf(stderr, "LineChartConfig: verticalDivisions %d raised to 2\n",
                 out.verticalDivisions);
    out.verticalDivisions = 2;
  }
  return true;
}

// -------------------- JSON writer --------------------

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

static void writeColor(JsonWriter& w, const char* key, const float c[4]) {
  w.Key(key);
  w.StartArray();
  for (int i = 0; i < 4; i++) w.Double(static_cast<double>(c[i]));
  w.EndArray();
}

static void writeGrid(JsonWriter& w, const char* key, const GridLineStyle& g) {
  w.Key(key);
  w.StartObject();
  writeColor(w, "color", g.color);
  w.Key("lineWidth"); w.Double(g.lineWidth);
  w.EndObject();
}

static void writeLabels(JsonWriter& w, const char* key, const AxisLabelStyle& l) {
  w.Key(key);
  w.StartObject();
  w.Key("fontSize"); w.Double(l.fontSize);
  writeColor(w, "color", l.color);
  w.EndObject();
}

std::string saveLineChartConfig(const LineChartConfig& c) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("name"); w.String(c.name.c_str());
  w.Key("lineWidth"); w.Double(c.lineWidth);
  writeColor(w, "tintColor", c.tintColor);
  writeColor(w, "hoverLineColor", c.hoverLineColor);

  w.Key("padding");
  w.StartObject();
  w.Key("top"); w.Double(c.padding.top);
  w.Key("left"); w.Double(c.padding.left);
  w.Key("bottom"); w.Double(c.padding.bottom);
  w.Key("right"); w.Double(c.padding.right);
  w.EndObject();
  w.Key("horizontalLabelsToTopPadding"); w.Double(c.horizontalLabelsToTopPadding);

  w.Key("verticalDivisions"); w.Int(c.verticalDivisions);
  w.Key("verticalGridSpacing"); w.Double(c.verticalGridSpacing);
  writeColor(w, "cursorColor", c.cursorColor);

  w.Key("showsHorizontalGridLines"); w.Bool(c.showsHorizontalGridLines);
  w.Key("showsVerticalGridLines"); w.Bool(c.showsVerticalGridLines);
  w.Key("showsCursor"); w.Bool(c.showsCursor);

  writeGrid(w, "horizontalGrid", c.horizontalGrid);
  writeGrid(w, "verticalGrid", c.verticalGrid);
  writeLabels(w, "horizontalLabels", c.horizontalLabels);
  writeLabels(w, "verticalLabels", c.verticalLabels);

  w.Key("dot");
  w.StartObject();
  w.Key("size"); w.Double(c.dot.size);
  writeColor(w, "color", c.dot.color);
  writeColor(w, "strokeColor", c.dot.strokeColor);
  w.Key("strokeWidth"); w.Double(c.dot.strokeWidth);
  w.EndObject();

  w.Key("cursorLabel");
  w.StartObject();
  w.Key("fontSize"); w.Double(c.cursorLabel.fontSize);
  writeColor(w, "backgroundColor", c.cursorLabel.backgroundColor);
  writeColor(w, "foregroundColor", c.cursorLabel.foregroundColor);
  w.EndObject();

  w.Key("dateFormat"); w.String(c.dateFormat.c_str());
  w.Key("dateUseUTC"); w.Bool(c.dateUseUTC);
  w.Key("animationDuration"); w.Double(c.animationDuration);
  w.Key("xLabelSpacing"); w.Double(c.xLabelSpacing);
  w.Key("tooltipHorizontalInset"); w.Double(c.tooltipHorizontalInset);
  w.EndObject();

  return sb.GetString();
}

} // namespace ac
