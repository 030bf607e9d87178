#pragma once
#include "ac/layout/LabelLayout.hpp"
#include "ac/math/Easing.hpp"

#include <vector>

namespace ac {

// Cross-fade between a stale and a fresh label set. The stale set is never
// matched against the fresh one: every old label fades out, every new label
// fades in, and both slide along the axis by a fixed distance.
struct LabelTransition {
  bool vertical{false};
  bool expanding{false};              // new set has more labels than the old
  std::vector<AxisLabel> outgoing;    // alpha 1 -> 0, offset 0 -> outgoingTo
  std::vector<AxisLabel> incoming;    // alpha 0 -> 1, offset incomingFrom -> 0
  Point2 outgoingTo;
  Point2 incomingFrom;
  AnimationSpec animation;
};

constexpr double kLabelSlideDistance = 10.0;

LabelTransition makeLabelTransition(std::vector<AxisLabel> oldLabels,
                                    std::vector<AxisLabel> newLabels,
                                    bool vertical,
                                    const AnimationSpec& animation);

struct LabelFrameState {
  const AxisLabel* label{nullptr};
  Rect frame;     // final frame shifted by the current slide offset
  double alpha{1.0};
};

// Visual state of both sets `elapsed` seconds into the transition. Outgoing
// labels come first, then incoming ones.
std::vector<LabelFrameState> sampleLabelTransition(const LabelTransition& transition,
                                                   double elapsed);

} // namespace ac
