#include "ac/text/FontMetrics.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace ac {

struct FontMetrics::FontInfo {
  stbtt_fontinfo font;
};

FontMetrics::FontMetrics() = default;

FontMetrics::~FontMetrics() = default;

bool FontMetrics::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);
  return initFont();
}

bool FontMetrics::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "FontMetrics: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  fontData_.resize(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(fontData_.data()), sz);
  return initFont();
}

bool FontMetrics::initFont() {
  fontLoaded_ = false;
  glyphs_.clear();
  if (!info_) info_ = std::make_unique<FontInfo>();

  int offset = stbtt_GetFontOffsetForIndex(fontData_.data(), 0);
  if (offset < 0 || !stbtt_InitFont(&info_->font, fontData_.data(), offset)) {
    std::fprintf(stderr, "FontMetrics: stbtt_InitFont failed\n");
    return false;
  }
  stbtt_GetFontVMetrics(&info_->font, &ascent_, &descent_, &lineGap_);
  fontLoaded_ = true;
  return true;
}

double FontMetrics::scaleFor(double fontSize) const {
  return static_cast<double>(
      stbtt_ScaleForMappingEmToPixels(&info_->font, static_cast<float>(fontSize)));
}

const GlyphMetrics* FontMetrics::getGlyph(std::uint32_t codepoint) const {
  if (!fontLoaded_) return nullptr;

  auto it = glyphs_.find(codepoint);
  if (it != glyphs_.end()) return &it->second;

  GlyphMetrics gm;
  gm.codepoint = codepoint;
  gm.glyphIndex = stbtt_FindGlyphIndex(&info_->font, static_cast<int>(codepoint));
  stbtt_GetGlyphHMetrics(&info_->font, gm.glyphIndex, &gm.advance, &gm.leftBearing);
  return &glyphs_.emplace(codepoint, gm).first->second;
}

double FontMetrics::lineHeight(double fontSize) const {
  if (!fontLoaded_) return 0.0;
  return static_cast<double>(ascent_ - descent_ + lineGap_) * scaleFor(fontSize);
}

Size2 FontMetrics::measure(const std::string& text, double fontSize) const {
  if (!fontLoaded_) return Size2{0.0, 0.0};

  double scale = scaleFor(fontSize);
  double width = 0.0;
  int prevGlyph = 0;

  std::size_t i = 0;
  while (i < text.size()) {
    std::uint32_t cp = decodeUtf8(text, i);
    const GlyphMetrics* g = getGlyph(cp);
    if (!g) continue;
    if (prevGlyph != 0) {
      width += stbtt_GetGlyphKernAdvance(&info_->font, prevGlyph, g->glyphIndex) * scale;
    }
    width += g->advance * scale;
    prevGlyph = g->glyphIndex;
  }
  return Size2{std::ceil(width), std::ceil(lineHeight(fontSize))};
}

std::uint32_t decodeUtf8(const std::string& text, std::size_t& i) {
  constexpr std::uint32_t kReplacement = 0xFFFD;
  auto byte = [&](std::size_t k) { return static_cast<unsigned char>(text[k]); };

  unsigned char c = byte(i);
  int extra = 0;
  std::uint32_t cp = 0;
  if (c < 0x80)                { cp = c;        extra = 0; }
  else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
  else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
  else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
  else { i++; return kReplacement; }

  if (i + static_cast<std::size_t>(extra) >= text.size()) {
    i = text.size();
    return kReplacement;
  }
  for (int k = 1; k <= extra; k++) {
    unsigned char cc = byte(i + static_cast<std::size_t>(k));
    if ((cc & 0xC0) != 0x80) {
      i += static_cast<std::size_t>(k);
      return kReplacement;
    }
    cp = (cp << 6) | (cc & 0x3F);
  }
  i += static_cast<std::size_t>(extra) + 1;
  return cp;
}

} // namespace ac
