// D1.1 - Geometry and Path unit test (pure C++)

#include "ac/geom/Geometry.hpp"
#include "ac/path/Path.hpp"

#include <cmath>
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
  // --- Test 1: Rect insets ---
  {
    ac::Rect r{0, 0, 100, 50};
    ac::Rect in = r.inset(ac::EdgeInsets{10, 5, 20, 15});
    requireNear(in.x, 5.0, 1e-12, "inset x");
    requireNear(in.y, 10.0, 1e-12, "inset y");
    requireNear(in.width, 80.0, 1e-12, "inset width");
    requireNear(in.height, 20.0, 1e-12, "inset height");

    ac::Rect c = ac::Rect{0, 0, 300, 100}.insetBy(1.75, 1.75);
    requireTrue(c == (ac::Rect{1.75, 1.75, 296.5, 96.5}), "insetBy by half line width");
    requireNear(c.maxX(), 298.25, 1e-12, "maxX");
    requireNear(c.midY(), 50.0, 1e-12, "midY");

    requireTrue((ac::Rect{0, 0, 0, 10}).isEmpty(), "zero width is empty");
    requireTrue(r.inset(ac::EdgeInsets{30, 0, 30, 0}).isEmpty(), "over-inset is empty");
    std::printf("  Test 1 (rect insets) PASS\n");
  }

  // --- Test 2: clampPoint is component-wise ---
  {
    ac::Rect r{0, 0, 100, 50};
    ac::Point2 p = ac::clampPoint(ac::Point2{-5, 200}, r);
    requireTrue(p == (ac::Point2{0, 50}), "clamped into corner");
    p = ac::clampPoint(ac::Point2{40, -1}, r);
    requireTrue(p == (ac::Point2{40, 0}), "only y clamped");
    p = ac::clampPoint(ac::Point2{40, 20}, r);
    requireTrue(p == (ac::Point2{40, 20}), "inside untouched");
    std::printf("  Test 2 (clampPoint) PASS\n");
  }

  // --- Test 3: element recording and current point ---
  {
    ac::Path path;
    ac::Point2 cur;
    requireTrue(!path.currentPoint(cur), "empty path has no current point");

    path.moveTo({0, 0});
    path.lineTo({10, 0});
    path.quadTo({15, 5}, {20, 0});
    path.cubicTo({22, 2}, {28, 2}, {30, 0});
    requireTrue(path.size() == 4, "4 elements");
    requireTrue(path.countOf(ac::PathOp::CubicTo) == 1, "1 cubic");
    requireTrue(path.currentPoint(cur) && cur == (ac::Point2{30, 0}), "pen at cubic end");

    path.close();
    requireTrue(path.currentPoint(cur) && cur == (ac::Point2{0, 0}), "close returns to subpath start");

    path.clear();
    requireTrue(path.empty(), "clear empties the path");
    std::printf("  Test 3 (elements) PASS\n");
  }

  // --- Test 4: full-circle arc ---
  {
    ac::Path path;
    path.addArc({50, 50}, 4.0, 0.0, 6.283185307179586, true);
    requireTrue(path.size() == 2, "move + arc");
    requireTrue(path.elements()[0].op == ac::PathOp::MoveTo, "arc opens a subpath");
    requireNear(path.elements()[0].pts[0].x, 54.0, 1e-9, "arc start x");
    requireNear(path.elements()[0].pts[0].y, 50.0, 1e-9, "arc start y");

    const ac::PathElement& arc = path.elements()[1];
    requireTrue(arc.op == ac::PathOp::ArcTo, "ArcTo");
    requireNear(arc.radius, 4.0, 1e-12, "radius");
    ac::Point2 end = arc.endPoint();
    requireNear(end.x, 54.0, 1e-9, "full sweep ends at start x");
    requireNear(end.y, 50.0, 1e-9, "full sweep ends at start y");
    requireTrue(path.countOf(ac::PathOp::Close) == 0, "arc is not closed");

    ac::Path joined;
    joined.moveTo({0, 0});
    joined.addArc({10, 0}, 2.0, 0.0, 1.0, false);
    requireTrue(joined.elements()[1].op == ac::PathOp::LineTo, "arc on open path connects with a line");
    std::printf("  Test 4 (arc) PASS\n");
  }

  // --- Test 5: interpolation ---
  {
    ac::Path from;
    from.moveTo({0, 0});
    from.lineTo({10, 10});
    ac::Path to;
    to.moveTo({10, 0});
    to.lineTo({20, 30});

    ac::Path mid = ac::interpolatePaths(from, to, 0.5);
    requireTrue(mid.size() == 2, "same structure");
    requireTrue(mid.elements()[0].pts[0] == (ac::Point2{5, 0}), "moveTo halfway");
    requireTrue(mid.elements()[1].pts[0] == (ac::Point2{15, 20}), "lineTo halfway");
    requireTrue(ac::interpolatePaths(from, to, 1.0) == to, "t=1 is target");

    ac::Path other;
    other.moveTo({0, 0});
    other.cubicTo({1, 1}, {2, 2}, {3, 3});
    requireTrue(ac::interpolatePaths(from, other, 0.3) == other, "mismatched structure snaps to target");
    std::printf("  Test 5 (interpolate) PASS\n");
  }

  std::printf("D1.1 geometry/path: ALL PASS\n");
  return 0;
}
