#include "ac/path/Path.hpp"

#include <cmath>

namespace ac {

Point2 PathElement::endPoint() const {
  switch (op) {
    case PathOp::MoveTo:
    case PathOp::LineTo:
      return pts[0];
    case PathOp::QuadTo:
      return pts[1];
    case PathOp::CubicTo:
      return pts[2];
    case PathOp::ArcTo:
      return Point2{pts[0].x + radius * std::cos(endAngle),
                    pts[0].y + radius * std::sin(endAngle)};
    case PathOp::Close:
      break;
  }
  return pts[0];
}

bool operator==(const PathElement& a, const PathElement& b) {
  if (a.op != b.op) return false;
  for (int i = 0; i < 3; i++) {
    if (a.pts[i] != b.pts[i]) return false;
  }
  return a.radius == b.radius && a.startAngle == b.startAngle &&
         a.endAngle == b.endAngle && a.clockwise == b.clockwise;
}

void Path::moveTo(const Point2& p) {
  PathElement e;
  e.op = PathOp::MoveTo;
  e.pts[0] = p;
  elements_.push_back(e);
}

void Path::lineTo(const Point2& p) {
  PathElement e;
  e.op = PathOp::LineTo;
  e.pts[0] = p;
  elements_.push_back(e);
}

void Path::quadTo(const Point2& control, const Point2& end) {
  PathElement e;
  e.op = PathOp::QuadTo;
  e.pts[0] = control;
  e.pts[1] = end;
  elements_.push_back(e);
}

void Path::cubicTo(const Point2& control1, const Point2& control2, const Point2& end) {
  PathElement e;
  e.op = PathOp::CubicTo;
  e.pts[0] = control1;
  e.pts[1] = control2;
  e.pts[2] = end;
  elements_.push_back(e);
}

void Path::addArc(const Point2& center, double radius,
                  double startAngle, double endAngle, bool clockwise) {
  Point2 start{center.x + radius * std::cos(startAngle),
               center.y + radius * std::sin(startAngle)};
  if (elements_.empty()) {
    moveTo(start);
  } else {
    lineTo(start);
  }

  PathElement e;
  e.op = PathOp::ArcTo;
  e.pts[0] = center;
  e.radius = radius;
  e.startAngle = startAngle;
  e.endAngle = endAngle;
  e.clockwise = clockwise;
  elements_.push_back(e);
}

void Path::close() {
  PathElement e;
  e.op = PathOp::Close;
  elements_.push_back(e);
}

std::size_t Path::countOf(PathOp op) const {
  std::size_t n = 0;
  for (const auto& e : elements_) {
    if (e.op == op) n++;
  }
  return n;
}

bool Path::currentPoint(Point2& out) const {
  if (elements_.empty()) return false;

  // Close returns the pen to the start of the last subpath
  if (elements_.back().op == PathOp::Close) {
    for (auto it = elements_.rbegin(); it != elements_.rend(); ++it) {
      if (it->op == PathOp::MoveTo) {
        out = it->pts[0];
        return true;
      }
    }
    return false;
  }
  out = elements_.back().endPoint();
  return true;
}

bool operator==(const Path& a, const Path& b) {
  return a.elements() == b.elements();
}

Path interpolatePaths(const Path& from, const Path& to, double t) {
  const auto& fe = from.elements();
  const auto& te = to.elements();
  if (fe.size() != te.size()) return to;
  for (std::size_t i = 0; i < fe.size(); i++) {
    if (fe[i].op != te[i].op) return to;
  }

  Path out;
  for (std::size_t i = 0; i < te.size(); i++) {
    const PathElement& a = fe[i];
    const PathElement& b = te[i];
    switch (b.op) {
      case PathOp::MoveTo:
        out.moveTo(lerpPoint(a.pts[0], b.pts[0], t));
        break;
      case PathOp::LineTo:
        out.lineTo(lerpPoint(a.pts[0], b.pts[0], t));
        break;
      case PathOp::QuadTo:
        out.quadTo(lerpPoint(a.pts[0], b.pts[0], t),
                   lerpPoint(a.pts[1], b.pts[1], t));
        break;
      case PathOp::CubicTo:
        out.cubicTo(lerpPoint(a.pts[0], b.pts[0], t),
                    lerpPoint(a.pts[1], b.pts[1], t),
                    lerpPoint(a.pts[2], b.pts[2], t));
        break;
      case PathOp::ArcTo: {
        PathElement e = b;
        e.pts[0] = lerpPoint(a.pts[0], b.pts[0], t);
        e.radius = a.radius + (b.radius - a.radius) * t;
        e.startAngle = a.startAngle + (b.startAngle - a.startAngle) * t;
        e.endAngle = a.endAngle + (b.endAngle - a.endAngle) * t;
        out.append(e);
        break;
      }
      case PathOp::Close:
        out.close();
        break;
    }
  }
  return out;
}

} // namespace ac
