#include "ac/path/CurveBuilder.hpp"

#include <algorithm>
#include <cmath>

namespace ac {

static constexpr double kTwoPi = 6.283185307179586;

Path CurveBuilder::smoothCurve(const std::vector<Point2>& points, const Rect& bounds) const {
  Path path;
  if (points.size() < 2) return path;

  path.moveTo(clampPoint(points[0], bounds));

  for (std::size_t i = 0; i + 1 < points.size(); i++) {
    const Point2& p0 = i > 0 ? points[i - 1] : points[i];
    const Point2& p1 = points[i];
    const Point2& p2 = points[i + 1];
    const Point2& p3 = i + 2 < points.size() ? points[i + 2] : points[i + 1];

    Point2 cp1{p1.x + (p2.x - p0.x) / 6.0, p1.y + (p2.y - p0.y) / 6.0};
    Point2 cp2{p2.x - (p3.x - p1.x) / 6.0, p2.y - (p3.y - p1.y) / 6.0};

    path.cubicTo(clampPoint(cp1, bounds),
                 clampPoint(cp2, bounds),
                 clampPoint(p2, bounds));
  }
  return path;
}

double CurveBuilder::dotRadius(double frameWidth, double frameHeight) const {
  double maxAllowed = std::min(frameWidth, frameHeight) * config_.dotRadiusFraction;
  return std::min(config_.maxDotRadius, maxAllowed);
}

Path CurveBuilder::singlePointDot(const Point2& center, double frameWidth,
                                  double frameHeight) const {
  Path path;
  path.addArc(center, dotRadius(frameWidth, frameHeight), 0.0, kTwoPi, true);
  return path;
}

} // namespace ac
