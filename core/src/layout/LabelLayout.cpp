#include "ac/layout/LabelLayout.hpp"
#include "ac/math/TimeFormat.hpp"
#include "ac/text/TextMeasurer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ac {

double LabelLayout::verticalLabelsWidth(const DataSeries& series) {
  if (series.empty()) return 40.0;
  double maxValue = series[0].value;
  for (const auto& p : series) maxValue = std::max(maxValue, p.value);

  if (maxValue < 100.0) return 40.0;       // XX.X
  if (maxValue < 1000.0) return 48.0;      // XXX.X
  if (maxValue < 10000.0) return 56.0;     // X,XXX.X
  if (maxValue < 100000.0) return 64.0;    // XX,XXX.X
  if (maxValue < 1000000.0) return 72.0;   // XXX,XXX.X
  return 80.0;
}

std::string LabelLayout::formatValue(double value) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.1f", value);
  return buf;
}

std::vector<double> LabelLayout::yLabelValues(const DataSeries& series) const {
  std::vector<double> values;
  if (series.empty()) return values;

  auto mm = std::minmax_element(series.begin(), series.end(),
      [](const ChartPoint& a, const ChartPoint& b) { return a.value < b.value; });
  double yMin = mm.first->value;
  double yMax = mm.second->value;

  if (series.size() == 1 || yMin == yMax) {
    double value = series[0].value;
    double pad = std::fabs(value * 0.2);
    yMin = value - pad;
    yMax = value + pad;
  }
  if (yMax - yMin < 1e-9) {
    double center = (yMin + yMax) * 0.5;
    yMin = center - 1.0;
    yMax = center + 1.0;
  }

  int divisions = std::max(2, config_.verticalDivisions);
  double step = (yMax - yMin) / static_cast<double>(divisions - 1);
  values.reserve(static_cast<std::size_t>(divisions));
  for (int i = 0; i < divisions; i++) {
    values.push_back(yMax - step * static_cast<double>(i));
  }
  return values;
}

std::vector<std::size_t> LabelLayout::thinLabels(const std::vector<double>& widths,
                                                 double availableWidth) {
  std::vector<std::size_t> indices;
  std::size_t n = widths.size();
  if (n == 0) return indices;

  double total = 0.0;
  for (double w : widths) total += w;

  if (total <= availableWidth) {
    indices.reserve(n);
    for (std::size_t i = 0; i < n; i++) indices.push_back(i);
    return indices;
  }

  double average = total / static_cast<double>(n);
  std::size_t maxLabels = 1;
  if (availableWidth > 0.0 && average > 0.0) {
    maxLabels = std::max<std::size_t>(1, static_cast<std::size_t>(availableWidth / average));
  }
  std::size_t step = (n + maxLabels - 1) / maxLabels;
  step = std::max<std::size_t>(2, step);

  for (std::size_t i = 0; i < n - 1; i += step) indices.push_back(i);
  if (indices.empty() || indices.back() != n - 1) indices.push_back(n - 1);
  return indices;
}

std::vector<AxisLabel> LabelLayout::buildYLabels(const DataSeries& series,
                                                 const TextMeasurer& measurer) const {
  std::vector<AxisLabel> labels;
  for (double v : yLabelValues(series)) {
    AxisLabel label;
    label.text = formatValue(v);
    label.isVertical = true;
    label.textSize = measurer.measure(label.text, config_.verticalLabels.fontSize);
    label.frame = Rect{0.0, 0.0, label.textSize.width, label.textSize.height};
    labels.push_back(std::move(label));
  }
  return labels;
}

std::vector<AxisLabel> LabelLayout::buildXLabels(const DataSeries& series, double viewWidth,
                                                 const TextMeasurer& measurer) const {
  std::vector<AxisLabel> all;
  all.reserve(series.size());
  std::vector<double> widths;
  widths.reserve(series.size());

  double fontSize = config_.horizontalLabels.fontSize;
  for (std::size_t i = 0; i < series.size(); i++) {
    AxisLabel label;
    label.text = formatTimestamp(series[i].timestamp, config_.dateFormat, config_.dateUseUTC);
    label.isVertical = false;
    label.textSize = measurer.measure(label.text, fontSize);
    label.frame = Rect{0.0, 0.0, label.textSize.width, label.textSize.height};
    label.sourceIndex = i;
    widths.push_back(label.textSize.width + config_.xLabelSpacing);
    all.push_back(std::move(label));
  }

  double gutter = verticalLabelsWidth(series);
  double available = viewWidth - config_.padding.left - config_.padding.right - gutter * 1.5;

  std::vector<AxisLabel> kept;
  for (std::size_t idx : thinLabels(widths, available)) {
    kept.push_back(std::move(all[idx]));
  }
  return kept;
}

void LabelLayout::placeXLabels(std::vector<AxisLabel>& labels, const Size2& viewSize,
                               double gutterWidth) const {
  if (labels.empty()) return;
  const EdgeInsets& pad = config_.padding;
  double available = viewSize.width - pad.left - pad.right - gutterWidth;

  if (labels.size() == 1) {
    AxisLabel& label = labels[0];
    double w = std::min(available, label.textSize.width);
    label.frame = Rect{gutterWidth + pad.left + available * 0.5 - w * 0.5,
                       viewSize.height - label.textSize.height,
                       w, label.textSize.height};
    return;
  }

  double totalSpacing = available - labels.back().textSize.width;
  double spacing = totalSpacing / static_cast<double>(labels.size() - 1);
  for (std::size_t i = 0; i < labels.size(); i++) {
    AxisLabel& label = labels[i];
    double w = std::min(spacing, label.textSize.width);
    double x;
    if (i == labels.size() - 1) {
      x = viewSize.width - w - pad.right;  // last label hugs the right edge
    } else {
      x = gutterWidth + pad.left + static_cast<double>(i) * spacing;
    }
    label.frame = Rect{x, viewSize.height - label.textSize.height, w, label.textSize.height};
  }
}

void LabelLayout::placeYLabels(std::vector<AxisLabel>& labels, const Size2& viewSize,
                               double bottomInset) const {
  if (labels.empty()) return;
  const EdgeInsets& pad = config_.padding;
  double availableHeight = viewSize.height - pad.top - pad.bottom - bottomInset;
  double yStep = labels.size() > 1
      ? availableHeight / static_cast<double>(labels.size() - 1)
      : 0.0;

  std::size_t count = labels.size();
  for (std::size_t k = 0; k < count; k++) {
    AxisLabel& label = labels[k];
    // k counts from the top; position counts from the bottom
    double i = static_cast<double>(count - 1 - k);
    double y = viewSize.height - i * yStep;
    label.frame = Rect{pad.left, y - label.textSize.height * 0.5 - bottomInset,
                       label.textSize.width, label.textSize.height};
  }
}

} // namespace ac
