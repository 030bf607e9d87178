#pragma once
#include "ac/text/TextMeasurer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ac {

// Horizontal metrics of one glyph in font units.
struct GlyphMetrics {
  std::uint32_t codepoint{0};
  int glyphIndex{0};
  int advance{0};
  int leftBearing{0};
};

// TrueType-backed text measurement. Sizes follow the point-size convention
// (font size maps to the em square), line height is ascent - descent + gap.
class FontMetrics : public TextMeasurer {
public:
  FontMetrics();
  ~FontMetrics() override;

  FontMetrics(const FontMetrics&) = delete;
  FontMetrics& operator=(const FontMetrics&) = delete;

  // Load a TTF/OTF from memory. The bytes are copied.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& path);

  bool isLoaded() const { return fontLoaded_; }

  Size2 measure(const std::string& text, double fontSize) const override;

  double lineHeight(double fontSize) const;

  // Lookup (and cache) metrics for a codepoint. Returns nullptr before a
  // font is loaded.
  const GlyphMetrics* getGlyph(std::uint32_t codepoint) const;

private:
  struct FontInfo;

  bool initFont();
  double scaleFor(double fontSize) const;

  std::vector<std::uint8_t> fontData_;
  std::unique_ptr<FontInfo> info_;
  bool fontLoaded_{false};

  int ascent_{0}, descent_{0}, lineGap_{0};

  mutable std::unordered_map<std::uint32_t, GlyphMetrics> glyphs_;
};

// Decode one UTF-8 sequence starting at text[i]; advances i. Malformed
// bytes decode as U+FFFD.
std::uint32_t decodeUtf8(const std::string& text, std::size_t& i);

} // namespace ac
