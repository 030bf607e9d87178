#pragma once
#include "ac/data/ChartPoint.hpp"
#include "ac/geom/Geometry.hpp"
#include "ac/style/LineChartConfig.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ac {

class TextMeasurer;

struct AxisLabel {
  std::string text;
  bool isVertical{false};
  Rect frame;          // view coordinates
  Size2 textSize;      // measured, before any width capping
  std::size_t sourceIndex{0};  // x-labels: index of the data point
};

// Computes the text and placement of both axis label sets.
//
// Y-labels are kept top-to-bottom (highest value first). X-labels follow the
// series order. All frames are in view coordinates, where the chart frame is
// the view inset by the padding, the y-label gutter and the x-label band.
class LabelLayout {
public:
  void setConfig(const LineChartConfig& cfg) { config_ = cfg; }

  // Width reserved left of the plot for y-labels, stepped on the series max.
  static double verticalLabelsWidth(const DataSeries& series);

  // "%.1f"
  static std::string formatValue(double value);

  // `divisions` values from max down to min. Singleton and flat series use
  // value +/- 20%. Empty series yields no values.
  std::vector<double> yLabelValues(const DataSeries& series) const;

  // Indices of the labels to keep. `widths` already include the spacing.
  // All are kept when they fit; otherwise every step-th index from 0
  // (step >= 2) plus the last index.
  static std::vector<std::size_t> thinLabels(const std::vector<double>& widths,
                                             double availableWidth);

  std::vector<AxisLabel> buildYLabels(const DataSeries& series,
                                      const TextMeasurer& measurer) const;

  // Thinned against the view width minus padding and 1.5x the gutter.
  std::vector<AxisLabel> buildXLabels(const DataSeries& series, double viewWidth,
                                      const TextMeasurer& measurer) const;

  void placeXLabels(std::vector<AxisLabel>& labels, const Size2& viewSize,
                    double gutterWidth) const;

  void placeYLabels(std::vector<AxisLabel>& labels, const Size2& viewSize,
                    double bottomInset) const;

private:
  LineChartConfig config_;
};

} // namespace ac
