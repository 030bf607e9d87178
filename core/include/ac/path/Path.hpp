#pragma once
#include "ac/geom/Geometry.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ac {

enum class PathOp : std::uint8_t {
  MoveTo = 0,
  LineTo,
  QuadTo,   // pts[0] = control, pts[1] = end
  CubicTo,  // pts[0] = control1, pts[1] = control2, pts[2] = end
  ArcTo,    // pts[0] = center
  Close
};

struct PathElement {
  PathOp op{PathOp::MoveTo};
  Point2 pts[3];

  // ArcTo only
  double radius{0};
  double startAngle{0}, endAngle{0};
  bool clockwise{true};

  // Point the pen rests on after this element.
  Point2 endPoint() const;
};

bool operator==(const PathElement& a, const PathElement& b);

// Flat, ordered list of drawing instructions handed to the render target.
// Coordinates are in the chart frame's local space.
class Path {
public:
  void moveTo(const Point2& p);
  void lineTo(const Point2& p);
  void quadTo(const Point2& control, const Point2& end);
  void cubicTo(const Point2& control1, const Point2& control2, const Point2& end);

  // Full or partial circle. Starts a new subpath at the arc's first point
  // when the path is empty, otherwise connects to it with a line.
  void addArc(const Point2& center, double radius,
              double startAngle, double endAngle, bool clockwise);

  void close();
  void append(const PathElement& e) { elements_.push_back(e); }
  void clear() { elements_.clear(); }

  const std::vector<PathElement>& elements() const { return elements_; }
  std::size_t size() const { return elements_.size(); }
  bool empty() const { return elements_.empty(); }
  std::size_t countOf(PathOp op) const;

  // Returns false for an empty path.
  bool currentPoint(Point2& out) const;

private:
  std::vector<PathElement> elements_;
};

bool operator==(const Path& a, const Path& b);
inline bool operator!=(const Path& a, const Path& b) { return !(a == b); }

// Element-wise interpolation for render targets that animate path changes
// themselves. Paths with different structure cannot be tweened; the result
// is then `to` unchanged.
Path interpolatePaths(const Path& from, const Path& to, double t);

} // namespace ac
