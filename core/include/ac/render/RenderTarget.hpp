#pragma once
#include "ac/cursor/CursorController.hpp"
#include "ac/layout/LabelLayout.hpp"
#include "ac/layout/LabelTransition.hpp"
#include "ac/math/Easing.hpp"
#include "ac/path/Path.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace ac {

enum class ChartLayer : std::uint8_t {
  Graph = 0,
  HorizontalGrid,
  VerticalGrid,
  Hover            // graph path restroked in the hover color, masked
};

// Animate from `from` to the submitted path over `spec`.
struct PathAnimation {
  Path from;
  AnimationSpec spec;
};

// Drawing surface owned by the host. The chart computes geometry and pushes
// it here; the target draws, animates and clips. All paths are in the chart
// frame's local space.
class RenderTarget {
public:
  virtual ~RenderTarget() = default;

  // `animation` is null for an immediate change. When it is not, the
  // target calls `completion` (if set) exactly once after the animation
  // finishes or is superseded. Completions are only passed together with
  // an animation.
  virtual void submitPath(ChartLayer layer, const Path& path,
                          const PathAnimation* animation,
                          std::function<void()> completion) = 0;

  virtual void setLayerVisible(ChartLayer layer, bool visible) = 0;

  // Replace one axis' label set. `transition` is null when the labels
  // only moved (layout) or when there was nothing to cross-fade from.
  virtual void submitLabels(bool vertical, const std::vector<AxisLabel>& labels,
                            const LabelTransition* transition) = 0;

  virtual void submitCursor(const CursorVisuals& visuals) = 0;
};

} // namespace ac
