#include "ac/math/Easing.hpp"

#include <algorithm>
#include <cmath>

namespace ac {

TimingFunction TimingFunction::forCurve(EasingCurve curve) {
  switch (curve) {
    case EasingCurve::EaseIn:    return TimingFunction{0.42, 0.0, 1.0, 1.0};
    case EasingCurve::EaseOut:   return TimingFunction{0.0, 0.0, 0.58, 1.0};
    case EasingCurve::EaseInOut: return TimingFunction{0.42, 0.0, 0.58, 1.0};
    case EasingCurve::Linear:    break;
  }
  return TimingFunction{0.0, 0.0, 1.0, 1.0};
}

static double bezierComponent(double t, double c1, double c2) {
  double mt = 1.0 - t;
  return 3.0 * mt * mt * t * c1 + 3.0 * mt * t * t * c2 + t * t * t;
}

double TimingFunction::evaluate(double progress) const {
  double x = std::min(std::max(progress, 0.0), 1.0);
  if (x == 0.0 || x == 1.0) return x;

  // x(t) is monotonic for x1, x2 in [0, 1]; bisect for t.
  double lo = 0.0, hi = 1.0, t = x;
  for (int i = 0; i < 40; i++) {
    t = (lo + hi) * 0.5;
    double xt = bezierComponent(t, x1, x2);
    if (std::fabs(xt - x) < 1e-7) break;
    if (xt < x) lo = t; else hi = t;
  }
  return bezierComponent(t, y1, y2);
}

double AnimationSpec::easedProgress(double elapsed) const {
  if (duration <= 0.0) return 1.0;
  return applyEasing(curve, elapsed / duration);
}

} // namespace ac
