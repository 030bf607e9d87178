#include "ac/cursor/CurveIntersect.hpp"

#include <algorithm>
#include <cmath>

namespace ac {

Point2 quadBezierPoint(double t, const Point2& p0, const Point2& p1, const Point2& p2) {
  double mt = 1.0 - t;
  return Point2{mt * mt * p0.x + 2.0 * mt * t * p1.x + t * t * p2.x,
                mt * mt * p0.y + 2.0 * mt * t * p1.y + t * t * p2.y};
}

Point2 cubicBezierPoint(double t, const Point2& p0, const Point2& p1,
                        const Point2& p2, const Point2& p3) {
  double mt = 1.0 - t;
  double mt2 = mt * mt;
  double mt3 = mt2 * mt;
  double t2 = t * t;
  double t3 = t2 * t;
  return Point2{mt3 * p0.x + 3.0 * mt2 * t * p1.x + 3.0 * mt * t2 * p2.x + t3 * p3.x,
                mt3 * p0.y + 3.0 * mt2 * t * p1.y + 3.0 * mt * t2 * p2.y + t3 * p3.y};
}

bool intersectLine(double targetX, const Point2& start, const Point2& end,
                   const IntersectConfig& cfg, Point2& out) {
  double minX = std::min(start.x, end.x) - cfg.tolerance;
  double maxX = std::max(start.x, end.x) + cfg.tolerance;
  if (targetX < minX || targetX > maxX) return false;

  double dx = end.x - start.x;
  double t = std::fabs(dx) < 1e-12 ? 0.0 : (targetX - start.x) / dx;
  t = std::min(std::max(t, 0.0), 1.0);
  out = Point2{targetX, start.y + (end.y - start.y) * t};
  return true;
}

// Bisection on a segment whose x grows with t. `eval` maps t to a point.
template <typename Eval>
static Point2 bisectForX(double targetX, const IntersectConfig& cfg, Eval eval) {
  double lower = 0.0;
  double upper = 1.0;
  for (int i = 0; i < cfg.iterations; i++) {
    double mid = (lower + upper) * 0.5;
    Point2 p = eval(mid);
    if (std::fabs(p.x - targetX) < cfg.tolerance) return p;
    if (p.x < targetX) {
      lower = mid;
    } else {
      upper = mid;
    }
  }
  return eval((lower + upper) * 0.5);
}

bool intersectQuad(double targetX, const Point2& p0, const Point2& p1, const Point2& p2,
                   const IntersectConfig& cfg, Point2& out) {
  double minX = std::min({p0.x, p1.x, p2.x}) - cfg.tolerance;
  double maxX = std::max({p0.x, p1.x, p2.x}) + cfg.tolerance;
  if (targetX < minX || targetX > maxX) return false;

  out = bisectForX(targetX, cfg, [&](double t) { return quadBezierPoint(t, p0, p1, p2); });
  return true;
}

bool intersectCubic(double targetX, const Point2& p0, const Point2& p1,
                    const Point2& p2, const Point2& p3,
                    const IntersectConfig& cfg, Point2& out) {
  double minX = std::min({p0.x, p1.x, p2.x, p3.x}) - cfg.tolerance;
  double maxX = std::max({p0.x, p1.x, p2.x, p3.x}) + cfg.tolerance;
  if (targetX < minX || targetX > maxX) return false;

  out = bisectForX(targetX, cfg,
                   [&](double t) { return cubicBezierPoint(t, p0, p1, p2, p3); });
  return true;
}

namespace {

// Last drawable segment seen while walking the path, for extrapolation.
struct LastSegment {
  bool valid{false};
  Point2 end;
  Point2 tangent;  // derivative at t = 1
};

} // namespace

bool findCurveIntersection(const Path& path, double targetX,
                           const IntersectConfig& cfg, Point2& out) {
  Point2 current;
  Point2 subpathStart;
  bool hasCurrent = false;
  LastSegment last;

  for (const PathElement& e : path.elements()) {
    switch (e.op) {
      case PathOp::MoveTo:
        current = e.pts[0];
        subpathStart = current;
        hasCurrent = true;
        break;

      case PathOp::LineTo:
        if (hasCurrent) {
          last = {true, e.pts[0], Point2{e.pts[0].x - current.x, e.pts[0].y - current.y}};
          if (intersectLine(targetX, current, e.pts[0], cfg, out)) return true;
        }
        current = e.pts[0];
        hasCurrent = true;
        break;

      case PathOp::QuadTo:
        if (hasCurrent) {
          last = {true, e.pts[1],
                  Point2{2.0 * (e.pts[1].x - e.pts[0].x), 2.0 * (e.pts[1].y - e.pts[0].y)}};
          if (intersectQuad(targetX, current, e.pts[0], e.pts[1], cfg, out)) return true;
        }
        current = e.pts[1];
        hasCurrent = true;
        break;

      case PathOp::CubicTo:
        if (hasCurrent) {
          last = {true, e.pts[2],
                  Point2{3.0 * (e.pts[2].x - e.pts[1].x), 3.0 * (e.pts[2].y - e.pts[1].y)}};
          // Only segments that end at or right of the target are tried.
          if (targetX <= e.pts[2].x &&
              intersectCubic(targetX, current, e.pts[0], e.pts[1], e.pts[2], cfg, out)) {
            return true;
          }
        }
        current = e.pts[2];
        hasCurrent = true;
        break;

      case PathOp::ArcTo:
        // Arcs mark a single point, they are never intersected.
        current = e.endPoint();
        hasCurrent = true;
        break;

      case PathOp::Close:
        current = subpathStart;
        break;
    }
  }

  if (!last.valid || targetX <= last.end.x) return false;
  if (targetX - last.end.x > cfg.maxExtrapolation) return false;
  if (last.tangent.x == 0.0) return false;

  double slope = last.tangent.y / last.tangent.x;
  out = Point2{targetX, last.end.y + slope * (targetX - last.end.x)};
  return true;
}

std::size_t nearestPointIndex(double relativeX, double chartWidth, std::size_t count) {
  if (count == 0) return 0;
  double xScale = chartWidth / static_cast<double>(std::max<std::size_t>(1, count - 1));
  if (xScale <= 0.0) return 0;
  double index = std::round(relativeX / xScale);
  if (index <= 0.0) return 0;
  return std::min(static_cast<std::size_t>(index), count - 1);
}

} // namespace ac
