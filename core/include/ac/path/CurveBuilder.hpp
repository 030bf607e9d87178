#pragma once
#include "ac/geom/Geometry.hpp"
#include "ac/path/Path.hpp"
#include <vector>

namespace ac {

struct CurveBuilderConfig {
  double maxDotRadius{4.0};
  double dotRadiusFraction{0.4};  // of the frame's shorter side
};

// Turns mapped screen points into the path submitted for the graph layer.
class CurveBuilder {
public:
  void setConfig(const CurveBuilderConfig& cfg) { config_ = cfg; }

  // Catmull-Rom through every point, emitted as cubic Bezier segments:
  // one MoveTo followed by points.size() - 1 CubicTo elements. Each end
  // point and control point is clamped into `bounds` on its own; the curve
  // between them may still leave the rectangle. Fewer than 2 points yields
  // an empty path.
  Path smoothCurve(const std::vector<Point2>& points, const Rect& bounds) const;

  // Marker drawn instead of a curve when the series holds one point.
  Path singlePointDot(const Point2& center, double frameWidth, double frameHeight) const;

  double dotRadius(double frameWidth, double frameHeight) const;

private:
  CurveBuilderConfig config_;
};

} // namespace ac
