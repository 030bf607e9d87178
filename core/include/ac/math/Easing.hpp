#pragma once
#include <cstdint>

namespace ac {

enum class EasingCurve : std::uint8_t {
  Linear = 0,
  EaseIn,
  EaseOut,
  EaseInOut
};

// Cubic-bezier timing function through (0,0), (x1,y1), (x2,y2), (1,1).
struct TimingFunction {
  double x1{0}, y1{0}, x2{1}, y2{1};

  static TimingFunction forCurve(EasingCurve curve);

  // Maps linear progress in [0, 1] to eased progress. Input is clamped.
  double evaluate(double progress) const;
};

inline double applyEasing(EasingCurve curve, double progress) {
  return TimingFunction::forCurve(curve).evaluate(progress);
}

// Duration and curve handed to the render target with every animated change.
struct AnimationSpec {
  double duration{0.3};   // seconds
  EasingCurve curve{EasingCurve::EaseInOut};

  double easedProgress(double elapsed) const;
};

} // namespace ac
