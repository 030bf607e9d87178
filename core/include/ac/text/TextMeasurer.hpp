#pragma once
#include "ac/geom/Geometry.hpp"
#include <string>

namespace ac {

// Host-provided text sizing used for label and tooltip frames.
class TextMeasurer {
public:
  virtual ~TextMeasurer() = default;

  // Single-line extent of `text` at `fontSize` points.
  virtual Size2 measure(const std::string& text, double fontSize) const = 0;
};

// Monospace approximation: every character advances the same distance.
// Useful for headless hosts and deterministic layout.
class FixedAdvanceMeasurer : public TextMeasurer {
public:
  explicit FixedAdvanceMeasurer(double advanceEm = 0.6, double lineHeightEm = 1.2)
    : advanceEm_(advanceEm), lineHeightEm_(lineHeightEm) {}

  Size2 measure(const std::string& text, double fontSize) const override {
    std::size_t chars = 0;
    for (unsigned char c : text) {
      if ((c & 0xC0) != 0x80) chars++;  // count UTF-8 lead bytes only
    }
    return Size2{static_cast<double>(chars) * advanceEm_ * fontSize,
                 lineHeightEm_ * fontSize};
  }

private:
  double advanceEm_;
  double lineHeightEm_;
};

} // namespace ac
