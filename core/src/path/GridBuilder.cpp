#include "ac/path/GridBuilder.hpp"

#include <algorithm>

namespace ac {

Path GridBuilder::horizontalLines(double width, double height) const {
  Path path;
  int steps = std::max(2, config_.horizontalLines);
  double stepSize = height / static_cast<double>(steps - 1);
  for (int i = 0; i < steps; i++) {
    double y = static_cast<double>(i) * stepSize;
    path.moveTo({0.0, y});
    path.lineTo({width, y});
  }
  return path;
}

int GridBuilder::verticalLineCount(double width) const {
  if (config_.verticalSpacing <= 0.0) return 2;
  return std::max(2, static_cast<int>(width / config_.verticalSpacing));
}

Path GridBuilder::verticalLines(double width, double height) const {
  Path path;
  int count = verticalLineCount(width);
  double stepSize = width / static_cast<double>(count - 1);
  for (int i = 0; i <= count; i++) {
    double x = static_cast<double>(i) * stepSize;
    path.moveTo({x, 0.0});
    path.lineTo({x, height});
  }
  return path;
}

} // namespace ac
