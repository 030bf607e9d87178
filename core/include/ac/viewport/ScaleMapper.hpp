#pragma once
#include "ac/data/ChartPoint.hpp"
#include "ac/geom/Geometry.hpp"
#include <cstddef>
#include <vector>

namespace ac {

struct ScaleMapperConfig {
  double xPaddingFraction{0.01};     // 1% of width on each side
  double yMarginFraction{0.05};      // 5% of value range above and below
  double singleValueFraction{0.2};   // singleton: value +/- 20%
  double minSpan{1e-9};              // below this the range is degenerate
  double fallbackHalfSpan{1.0};      // degenerate range becomes center +/- this
};

// Data-to-screen transform for one series inside one chart frame.
// Screen space is the frame's local space: origin top-left, y down.
struct ScaleMapping {
  bool singlePoint{false};
  std::size_t count{0};
  double width{0}, height{0};
  double xPadding{0};
  double xStep{0};
  double yMin{0}, yMax{1};
  double yScale{1};   // pixels per value unit
  Rect clampRect;     // frame inset by half the line width

  double xForIndex(std::size_t index) const;
  double yForValue(double value) const;
  Point2 screenPoint(std::size_t index, double value) const {
    return Point2{xForIndex(index), yForValue(value)};
  }
};

class ScaleMapper {
public:
  void setConfig(const ScaleMapperConfig& cfg) { config_ = cfg; }
  const ScaleMapperConfig& config() const { return config_; }

  // Returns false for an empty series; `out` is left untouched.
  bool compute(const DataSeries& series, double width, double height,
               double lineWidth, ScaleMapping& out) const;

  // Widens [lo, hi] to center +/- fallbackHalfSpan when it collapses.
  void guardRange(double& lo, double& hi) const;

  // Screen positions for every point of the series, in order.
  static std::vector<Point2> mapSeries(const DataSeries& series,
                                       const ScaleMapping& mapping);

private:
  ScaleMapperConfig config_;
};

} // namespace ac
