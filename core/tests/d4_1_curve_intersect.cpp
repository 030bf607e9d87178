// D4.1 - Curve intersection and nearest index (pure C++)
// Tests: line/quad/cubic solvers, first-match walk, exit-tangent
// extrapolation with its 100 px limit, coarse index rounding, index at
// each mapped data x.

#include "ac/cursor/CurveIntersect.hpp"
#include "ac/path/CurveBuilder.hpp"
#include "ac/viewport/ScaleMapper.hpp"

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

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
  ac::IntersectConfig cfg;

  // --- Test 1: line segments ---
  {
    ac::Point2 out;
    requireTrue(ac::intersectLine(50, {0, 10}, {100, 30}, cfg, out), "inside");
    requireNear(out.y, 20.0, 1e-12, "linear y");
    requireTrue(ac::intersectLine(100.4, {0, 10}, {100, 30}, cfg, out), "within tolerance");
    requireNear(out.y, 30.0, 1e-12, "t clamped to 1");
    requireTrue(!ac::intersectLine(200, {0, 10}, {100, 30}, cfg, out), "outside");
    requireTrue(ac::intersectLine(5, {5, 0}, {5, 10}, cfg, out), "vertical segment");
    requireNear(out.y, 0.0, 1e-12, "vertical segment uses its start");
    std::printf("  Test 1 (line) PASS\n");
  }

  // --- Test 2: quadratic segment ---
  {
    ac::Path path;
    path.moveTo({0, 0});
    path.quadTo({10, 20}, {20, 0});
    ac::Point2 out;
    requireTrue(ac::findCurveIntersection(path, 10, cfg, out), "hit");
    requireNear(out.y, 10.0, 1e-9, "apex of the quad");
    std::printf("  Test 2 (quad) PASS\n");
  }

  // --- Test 3: cubic segment and extrapolation ---
  {
    ac::Path path;
    path.moveTo({0, 0});
    path.cubicTo({10, 10}, {20, 20}, {30, 30});
    ac::Point2 out;

    requireTrue(ac::findCurveIntersection(path, 15, cfg, out), "cubic hit");
    requireNear(out.y, 15.0, 0.6, "on the diagonal");

    requireTrue(ac::findCurveIntersection(path, 80, cfg, out), "extrapolated");
    requireNear(out.x, 80.0, 1e-12, "extrapolated x is the target");
    requireNear(out.y, 80.0, 1e-9, "follows the exit tangent");

    requireTrue(ac::findCurveIntersection(path, 130, cfg, out), "exactly 100 px past the end");
    requireTrue(!ac::findCurveIntersection(path, 130.5, cfg, out), "beyond 100 px");
    requireTrue(!ac::findCurveIntersection(path, -10, cfg, out), "left of the path");

    ac::Path upright;
    upright.moveTo({0, 0});
    upright.cubicTo({10, 0}, {30, 0}, {30, 10});
    requireTrue(!ac::findCurveIntersection(upright, 50, cfg, out), "vertical exit tangent");

    requireTrue(!ac::findCurveIntersection(ac::Path{}, 10, cfg, out), "empty path");
    std::printf("  Test 3 (cubic + extrapolation) PASS\n");
  }

  // --- Test 4: first matching segment wins ---
  {
    ac::Path path;
    path.moveTo({0, 0});
    path.lineTo({10, 0});
    path.lineTo({20, 50});
    ac::Point2 out;
    requireTrue(ac::findCurveIntersection(path, 10, cfg, out), "shared vertex");
    requireNear(out.y, 0.0, 1e-12, "earlier segment answers");
    std::printf("  Test 4 (first match) PASS\n");
  }

  // --- Test 5: midpoint of a two-point chart curve is the mean value ---
  {
    ac::DataSeries series = {{10.0, 0.0}, {30.0, 60.0}};
    ac::ScaleMapper mapper;
    ac::ScaleMapping m;
    requireTrue(mapper.compute(series, 300, 100, 0.0, m), "mapping");
    ac::CurveBuilder builder;
    ac::Path curve = builder.smoothCurve(ac::ScaleMapper::mapSeries(series, m), m.clampRect);

    ac::Point2 out;
    requireTrue(ac::findCurveIntersection(curve, 150, cfg, out), "hit");
    requireNear(out.y, m.yForValue(20.0), 0.5, "mean value");
    std::printf("  Test 5 (chart midpoint) PASS\n");
  }

  // --- Test 6: nearest index ---
  {
    requireTrue(ac::nearestPointIndex(0, 294, 3) == 0, "left edge");
    requireTrue(ac::nearestPointIndex(147, 294, 3) == 1, "exact middle");
    requireTrue(ac::nearestPointIndex(294, 294, 3) == 2, "right edge");
    requireTrue(ac::nearestPointIndex(73, 294, 3) == 0, "rounds down");
    requireTrue(ac::nearestPointIndex(74, 294, 3) == 1, "rounds up");
    requireTrue(ac::nearestPointIndex(500, 294, 3) == 2, "clamped high");
    requireTrue(ac::nearestPointIndex(-10, 294, 3) == 0, "clamped low");
    requireTrue(ac::nearestPointIndex(200, 294, 1) == 0, "singleton");
    requireTrue(ac::nearestPointIndex(10, 0, 3) == 0, "zero width");
    std::printf("  Test 6 (nearest index) PASS\n");
  }

  // --- Test 7: mapped data x resolves to its own index ---
  {
    ac::ScaleMapper mapper;
    for (std::size_t n : {std::size_t(3), std::size_t(50)}) {
      ac::DataSeries series;
      for (std::size_t i = 0; i < n; i++) {
        series.push_back(ac::ChartPoint{static_cast<double>(i % 7), 60.0 * static_cast<double>(i)});
      }
      ac::ScaleMapping m;
      requireTrue(mapper.compute(series, 300, 100, 0.0, m), "mapping");
      for (std::size_t i = 0; i < n; i++) {
        requireTrue(ac::nearestPointIndex(m.xForIndex(i), m.width, n) == i, "index at mapped x");
      }
    }
    std::printf("  Test 7 (mapped x to index) PASS\n");
  }

  std::printf("D4.1 curve intersect: ALL PASS\n");
  return 0;
}
