#pragma once

#include <ledmatrix/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <variant>
#include <vector>

namespace ledmatrix {

//=============================================================================
// Layout modes
//=============================================================================

// Single line, left to right
struct Horizontal {
    bool operator==(const Horizontal&) const = default;
};

// Single column, top to bottom
struct Vertical {
    bool operator==(const Vertical&) const = default;
};

// Paragraphs broken into lines no wider than lineWidth pixels
struct Wrapped {
    int lineWidth = 0;
    bool operator==(const Wrapped&) const = default;
};

using TextLayout = std::variant<Horizontal, Vertical, Wrapped>;

//=============================================================================
// Layout result
//=============================================================================

struct PlacedGlyph {
    uint32_t codepoint = 0;
    int x = 0;
    int y = 0;  // baseline
};

struct LaidOutText {
    std::vector<PlacedGlyph> glyphs;
    int advance = 0;  // horizontal or vertical extent, in pixels
    int lines = 0;
};

// Width used to place a codepoint; must match what the driver will draw
using GlyphWidthFn = std::function<int(uint32_t codepoint)>;

struct TextMetrics {
    int fontHeight = 0;
    int kerningOffset = 0;
    int leading = 0;
};

// Decodes UTF-8; every malformed byte becomes U+FFFD
std::vector<uint32_t> decodeUtf8(std::string_view text);

/**
 * Places every glyph of `text` starting at (x, y), y being the baseline of the
 * first line.
 *
 *   Horizontal  advance = sum of widths + (k-1) * kerning
 *   Vertical    advance = k * height + (k-1) * kerning
 *   Wrapped     advance = lines * height + (lines-1) * leading
 *
 * Wrapped layout splits paragraphs at '\n' and words at space or tab, then
 * picks break points with breakLinesOptimal(). Fails on a non-positive line
 * width.
 */
Result<LaidOutText> layoutText(std::string_view text, const TextLayout& layout, int x, int y,
                               const TextMetrics& metrics, const GlyphWidthFn& glyphWidth);

//=============================================================================
// Line breaking over word widths
//
// A line holding words [i, j] is as wide as the sum of their widths plus
// (j - i) * gap, gap being the pixels between two words. Breaks are returned
// as the index of the first word of every line.
//=============================================================================

int lineWidthOf(const std::vector<int>& wordWidths, int gap, size_t first, size_t last);

// Minimizes the sum over all lines but the last of (lineWidth - width)^2.
// A word wider than lineWidth gets a line to itself at no cost.
std::vector<size_t> breakLinesOptimal(const std::vector<int>& wordWidths, int gap, int lineWidth);

// First fit: every line takes as many words as fit
std::vector<size_t> breakLinesGreedy(const std::vector<int>& wordWidths, int gap, int lineWidth);

// The quantity breakLinesOptimal() minimizes, for any set of breaks
int64_t raggedness(const std::vector<int>& wordWidths, int gap, int lineWidth,
                   const std::vector<size_t>& lineStarts);

} // namespace ledmatrix
