#pragma once

#include <ledmatrix/result.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledmatrix {

//=============================================================================
// BdfFont - Glyph Bitmap Distribution Format reader for the virtual driver
//
// Only the subset needed for monochrome panel fonts is read:
//   FONTBOUNDINGBOX w h xoff yoff   -> font height, baseline = h + yoff
//   ENCODING n / DWIDTH dx dy / BBX w h xoff yoff / BITMAP rows
// Glyph rows are stored MSB-first, at most 32 pixels wide.
//=============================================================================

class BdfFont {
public:
    struct Glyph {
        int deviceWidth = 0;
        int width = 0;
        int height = 0;
        int xOffset = 0;
        int yOffset = 0;                // BBX offset, bottom of glyph relative to baseline
        std::vector<uint32_t> rows;     // top row first
    };

    static constexpr uint32_t REPLACEMENT_CODEPOINT = 0xFFFD;
    static constexpr int MAX_GLYPH_WIDTH = 32;
    static constexpr int MAX_GLYPH_HEIGHT = 256;

    using PixelWriter = std::function<void(int x, int y)>;

    Result<void> load(const std::string& path);

    bool isLoaded() const { return _loaded; }
    int height() const { return _loaded ? _height : -1; }
    int baseline() const { return _baseline; }
    size_t glyphCount() const { return _glyphs.size(); }

    const Glyph* findGlyph(uint32_t codepoint) const;

    // Device width, -1 when the font has no such glyph
    int characterWidth(uint32_t codepoint) const;

    // Rasterizes the glyph (or U+FFFD) with its baseline at y; returns the advance
    int drawGlyph(int x, int y, uint32_t codepoint, const PixelWriter& writePixel) const;

private:
    bool _loaded = false;
    int _height = -1;
    int _baseline = 0;
    std::unordered_map<uint32_t, Glyph> _glyphs;
};

} // namespace ledmatrix
