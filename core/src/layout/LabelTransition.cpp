#include "ac/layout/LabelTransition.hpp"

namespace ac {

LabelTransition makeLabelTransition(std::vector<AxisLabel> oldLabels,
                                    std::vector<AxisLabel> newLabels,
                                    bool vertical,
                                    const AnimationSpec& animation) {
  LabelTransition t;
  t.vertical = vertical;
  t.expanding = newLabels.size() > oldLabels.size();
  t.animation = animation;

  // Shrinking cross-fades in place.
  double d = t.expanding ? kLabelSlideDistance : 0.0;
  if (vertical) {
    t.incomingFrom = Point2{0.0, d};
    t.outgoingTo = Point2{0.0, -d};
  } else {
    t.incomingFrom = Point2{-d, 0.0};
    t.outgoingTo = Point2{d, 0.0};
  }

  t.outgoing = std::move(oldLabels);
  t.incoming = std::move(newLabels);
  return t;
}

static Rect offsetFrame(const Rect& r, const Point2& offset, double scale) {
  return Rect{r.x + offset.x * scale, r.y + offset.y * scale, r.width, r.height};
}

std::vector<LabelFrameState> sampleLabelTransition(const LabelTransition& transition,
                                                   double elapsed) {
  double p = transition.animation.easedProgress(elapsed);

  std::vector<LabelFrameState> states;
  states.reserve(transition.outgoing.size() + transition.incoming.size());

  for (const auto& label : transition.outgoing) {
    LabelFrameState s;
    s.label = &label;
    s.frame = offsetFrame(label.frame, transition.outgoingTo, p);
    s.alpha = 1.0 - p;
    states.push_back(s);
  }
  for (const auto& label : transition.incoming) {
    LabelFrameState s;
    s.label = &label;
    s.frame = offsetFrame(label.frame, transition.incomingFrom, 1.0 - p);
    s.alpha = p;
    states.push_back(s);
  }
  return states;
}

} // namespace ac
