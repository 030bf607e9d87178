#pragma once
#include "ac/geom/Geometry.hpp"
#include "ac/path/Path.hpp"
#include <cstddef>

namespace ac {

struct IntersectConfig {
  double tolerance{0.5};               // pixels, in x
  int iterations{12};                  // bisection steps per segment
  double maxExtrapolation{100.0};      // pixels past the last segment
};

Point2 quadBezierPoint(double t, const Point2& p0, const Point2& p1, const Point2& p2);
Point2 cubicBezierPoint(double t, const Point2& p0, const Point2& p1,
                        const Point2& p2, const Point2& p3);

// Per-segment solvers. Each returns false when targetX lies outside the
// segment's x-extent (widened by the tolerance).
bool intersectLine(double targetX, const Point2& start, const Point2& end,
                   const IntersectConfig& cfg, Point2& out);
bool intersectQuad(double targetX, const Point2& p0, const Point2& p1, const Point2& p2,
                   const IntersectConfig& cfg, Point2& out);
bool intersectCubic(double targetX, const Point2& p0, const Point2& p1,
                    const Point2& p2, const Point2& p3,
                    const IntersectConfig& cfg, Point2& out);

// Where the vertical line x = targetX meets the path. Segments are visited
// in path order and the first one that yields a point wins. Past the end
// of the path the last segment's exit tangent is followed for at most
// maxExtrapolation pixels. Returns false when nothing matches.
bool findCurveIntersection(const Path& path, double targetX,
                           const IntersectConfig& cfg, Point2& out);

// Data index under relativeX assuming points spread evenly over chartWidth.
// Deliberately coarse: it ignores the 1% x-padding used by the curve.
std::size_t nearestPointIndex(double relativeX, double chartWidth, std::size_t count);

} // namespace ac
