#include "ac/viewport/ScaleMapper.hpp"

#include <algorithm>
#include <cmath>

namespace ac {

double ScaleMapping::xForIndex(std::size_t index) const {
  if (singlePoint) return width * 0.5;
  return xPadding + static_cast<double>(index) * xStep;
}

double ScaleMapping::yForValue(double value) const {
  double raw = height - (value - yMin) * yScale;
  if (singlePoint) return raw;
  return std::min(std::max(raw, clampRect.minY()), clampRect.maxY());
}

void ScaleMapper::guardRange(double& lo, double& hi) const {
  if (hi - lo >= config_.minSpan) return;
  double center = (lo + hi) * 0.5;
  lo = center - config_.fallbackHalfSpan;
  hi = center + config_.fallbackHalfSpan;
}

bool ScaleMapper::compute(const DataSeries& series, double width, double height,
                          double lineWidth, ScaleMapping& out) const {
  if (series.empty()) return false;

  ScaleMapping m;
  m.count = series.size();
  m.width = width;
  m.height = height;
  m.clampRect = Rect{0, 0, width, height}.insetBy(lineWidth * 0.5, lineWidth * 0.5);

  if (series.size() == 1) {
    m.singlePoint = true;
    double value = series[0].value;
    double pad = value * config_.singleValueFraction;
    m.yMin = value - pad;
    m.yMax = value + pad;
    // Negative values give an inverted pair; keep yMin below yMax.
    if (m.yMin > m.yMax) std::swap(m.yMin, m.yMax);
    guardRange(m.yMin, m.yMax);
    m.yScale = height / (m.yMax - m.yMin);
    out = m;
    return true;
  }

  m.xPadding = width * config_.xPaddingFraction;
  double effectiveWidth = width - 2.0 * m.xPadding;
  m.xStep = effectiveWidth / static_cast<double>(std::max<std::size_t>(1, series.size() - 1));

  auto mm = std::minmax_element(series.begin(), series.end(),
      [](const ChartPoint& a, const ChartPoint& b) { return a.value < b.value; });
  double lo = mm.first->value;
  double hi = mm.second->value;
  double margin = (hi - lo) * config_.yMarginFraction;
  m.yMin = lo - margin;
  m.yMax = hi + margin;
  guardRange(m.yMin, m.yMax);
  m.yScale = height / (m.yMax - m.yMin);

  out = m;
  return true;
}

std::vector<Point2> ScaleMapper::mapSeries(const DataSeries& series,
                                           const ScaleMapping& mapping) {
  std::vector<Point2> pts;
  pts.reserve(series.size());
  for (std::size_t i = 0; i < series.size(); i++) {
    pts.push_back(mapping.screenPoint(i, series[i].value));
  }
  return pts;
}

} // namespace ac
