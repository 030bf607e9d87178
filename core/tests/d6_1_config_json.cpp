// D6.1 - LineChartConfig presets and JSON round trip
// Tests:
//   1. presets differ where expected
//   2. partial JSON keeps unspecified fields
//   3. wrong types are ignored, malformed JSON is rejected
//   4. save -> load reproduces the configuration

#include "ac/style/LineChartConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: presets ---
  {
    ac::LineChartConfig plain = ac::plainLineChartConfig();
    ac::LineChartConfig def = ac::defaultLineChartConfig();
    requireTrue(plain.name == "Plain" && def.name == "Default", "preset names");
    requireNear(plain.lineWidth, 3.5, 1e-12, "line width");
    requireNear(plain.padding.top, 20.0, 1e-12, "plain top padding");
    requireNear(plain.padding.right, 20.0, 1e-12, "plain right padding");
    requireTrue(plain.showsVerticalGridLines, "plain shows vertical grid");
    requireTrue(!def.showsVerticalGridLines, "default hides vertical grid");
    requireNear(def.padding.top + def.padding.right, 0.0, 1e-12, "default has no padding");
    requireNear(def.verticalLabels.fontSize, 14.0, 1e-12, "default y-label font");
    requireTrue(plain.verticalDivisions == 5, "5 divisions");
    requireTrue(plain.dateFormat == "%b %d", "date format");
    std::printf("  Test 1 (presets) PASS\n");
  }

  // --- Test 2: partial load ---
  {
    ac::LineChartConfig cfg = ac::plainLineChartConfig();
    const char* json = R"({
      "lineWidth": 2,
      "padding": {"left": 8},
      "showsCursor": false,
      "dot": {"size": 12},
      "tintColor": [1, 0, 0, 1],
      "unknownKey": 42
    })";
    requireTrue(ac::loadLineChartConfig(json, cfg), "load ok");
    requireNear(cfg.lineWidth, 2.0, 1e-12, "lineWidth loaded");
    requireNear(cfg.padding.left, 8.0, 1e-12, "padding.left loaded");
    requireNear(cfg.padding.top, 20.0, 1e-12, "padding.top kept");
    requireTrue(!cfg.showsCursor, "showsCursor loaded");
    requireNear(cfg.dot.size, 12.0, 1e-12, "dot.size loaded");
    requireNear(cfg.dot.strokeWidth, 2.5, 1e-12, "dot.strokeWidth kept");
    requireNear(cfg.tintColor[0], 1.0, 1e-6, "tint red");
    requireNear(cfg.tintColor[2], 0.0, 1e-6, "tint blue");
    requireTrue(cfg.name == "Plain", "name kept");
    std::printf("  Test 2 (partial load) PASS\n");
  }

  // --- Test 3: bad input ---
  {
    ac::LineChartConfig cfg = ac::plainLineChartConfig();
    requireTrue(ac::loadLineChartConfig(R"({"lineWidth": "wide", "tintColor": [1, 2]})", cfg),
                "wrong types still load");
    requireNear(cfg.lineWidth, 3.5, 1e-12, "string ignored");
    requireNear(cfg.tintColor[3], 1.0, 1e-6, "short color ignored");

    requireTrue(!ac::loadLineChartConfig("{\"lineWidth\": ", cfg), "truncated JSON rejected");
    requireTrue(!ac::loadLineChartConfig("[1, 2, 3]", cfg), "array rejected");

    requireTrue(ac::loadLineChartConfig(R"({"verticalDivisions": 1})", cfg), "load divisions");
    requireTrue(cfg.verticalDivisions == 2, "divisions raised to 2");
    std::printf("  Test 3 (bad input) PASS\n");
  }

  // --- Test 4: save and reload ---
  {
    ac::LineChartConfig src = ac::defaultLineChartConfig();
    src.dateFormat = "%H:%M";
    src.animationDuration = 0.5;
    src.cursorLabel.fontSize = 11.0;
    std::string json = ac::saveLineChartConfig(src);
    requireTrue(!json.empty() && json[0] == '{', "object written");

    ac::LineChartConfig dst = ac::plainLineChartConfig();
    requireTrue(ac::loadLineChartConfig(json, dst), "reload ok");
    requireTrue(dst.name == "Default", "name");
    requireTrue(!dst.showsVerticalGridLines, "vertical grid flag");
    requireTrue(dst.dateFormat == "%H:%M", "date format");
    requireNear(dst.animationDuration, 0.5, 1e-12, "duration");
    requireNear(dst.cursorLabel.fontSize, 11.0, 1e-12, "cursor label font");
    requireNear(dst.hoverLineColor[0], src.hoverLineColor[0], 1e-6, "hover color");
    requireNear(dst.padding.top, 0.0, 1e-12, "padding");
    std::printf("  Test 4 (save/load) PASS\n");
  }

  std::printf("D6.1 config json: ALL PASS\n");
  return 0;
}
