#pragma once
#include "ac/geom/Geometry.hpp"

#include <string>

namespace ac {

struct GridLineStyle {
  float color[4] = {0.5f, 0.5f, 0.5f, 0.5f};
  double lineWidth{0.5};
};

struct AxisLabelStyle {
  double fontSize{13.0};
  float color[4] = {0.24f, 0.24f, 0.26f, 0.6f};
};

// Tracking marker drawn on the curve under the cursor.
struct DotStyle {
  double size{10.0};
  float color[4] = {0.345f, 0.337f, 0.839f, 1.0f};
  float strokeColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  double strokeWidth{2.5};
};

struct CursorLabelStyle {
  double fontSize{13.0};
  float backgroundColor[4] = {0.949f, 0.949f, 0.969f, 1.0f};
  float foregroundColor[4] = {0.235f, 0.235f, 0.263f, 0.6f};
};

// Appearance and layout settings, fixed for the lifetime of a chart.
struct LineChartConfig {
  std::string name;

  double lineWidth{3.5};
  float tintColor[4] = {0.345f, 0.337f, 0.839f, 1.0f};
  float hoverLineColor[4] = {0.5f, 0.5f, 0.5f, 1.0f};
  EdgeInsets padding{20.0, 0.0, 0.0, 20.0};
  double horizontalLabelsToTopPadding{16.0};

  int verticalDivisions{5};
  double verticalGridSpacing{50.0};

  float cursorColor[4] = {1.0f, 0.231f, 0.188f, 1.0f};

  bool showsHorizontalGridLines{true};
  bool showsVerticalGridLines{true};
  bool showsCursor{true};

  GridLineStyle horizontalGrid;
  GridLineStyle verticalGrid;
  AxisLabelStyle horizontalLabels;
  AxisLabelStyle verticalLabels;
  DotStyle dot;
  CursorLabelStyle cursorLabel;

  std::string dateFormat{"%b %d"};   // strftime pattern for x-labels
  bool dateUseUTC{false};

  double animationDuration{0.3};
  double xLabelSpacing{20.0};        // added to each measured x-label width
  double tooltipHorizontalInset{5.0};
};

// Built-in presets
LineChartConfig plainLineChartConfig();
LineChartConfig defaultLineChartConfig();

// Apply a JSON object onto `out`. Keys that are missing or of the wrong
// type leave the current value untouched. Returns false on malformed JSON.
bool loadLineChartConfig(const std::string& json, LineChartConfig& out);

std::string saveLineChartConfig(const LineChartConfig& config);

} // namespace ac
