#pragma once
#include "ac/path/Path.hpp"

namespace ac {

// Background grid for the chart frame. Lines are emitted as MoveTo/LineTo
// pairs in frame-local coordinates.
struct GridConfig {
  int horizontalLines{5};           // equals the number of y-label divisions
  double verticalSpacing{50.0};     // desired distance between vertical lines
};

class GridBuilder {
public:
  void setConfig(const GridConfig& cfg) { config_ = cfg; }

  // `horizontalLines` lines from top edge to bottom edge inclusive.
  Path horizontalLines(double width, double height) const;

  // max(2, width / spacing) columns; one extra line is drawn past the last
  // column so the right edge is always covered.
  Path verticalLines(double width, double height) const;

  int verticalLineCount(double width) const;

private:
  GridConfig config_;
};

} // namespace ac
