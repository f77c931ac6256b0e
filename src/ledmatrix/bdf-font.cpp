#include "bdf-font.h"
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ledmatrix {

// Parses one BITMAP row ("1F80") into a left-aligned 32 bit mask
static bool parseBitmapRow(const std::string& hex, uint32_t& out) {
    if (hex.empty() || hex.size() > 8) return false;
    uint32_t value = 0;
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else value |= static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }
    out = hex.size() == 8 ? value : value << (32 - 4 * hex.size());
    return true;
}

Result<void> BdfFont::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open font file: " + path);
    }

    std::string line;
    if (!std::getline(file, line) || line.rfind("STARTFONT", 0) != 0) {
        return Err<void>("Not a BDF font: " + path);
    }

    bool haveBoundingBox = false;
    bool inChar = false;
    bool haveGlyphBox = false;
    bool haveBitmap = false;
    int encoding = -1;
    Glyph glyph;
    int lineNo = 1;

    while (std::getline(file, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream ss(line);
        std::string keyword;
        ss >> keyword;

        if (keyword == "FONTBOUNDINGBOX") {
            int w, h, xoff, yoff;
            if (!(ss >> w >> h >> xoff >> yoff) || h <= 0) {
                return Err<void>("Malformed FONTBOUNDINGBOX at line " + std::to_string(lineNo));
            }
            _height = h;
            _baseline = h + yoff;
            haveBoundingBox = true;
        } else if (keyword == "STARTCHAR") {
            inChar = true;
            haveGlyphBox = false;
            haveBitmap = false;
            encoding = -1;
            glyph = Glyph{};
        } else if (keyword == "ENCODING" && inChar) {
            if (!(ss >> encoding)) {
                return Err<void>("Malformed ENCODING at line " + std::to_string(lineNo));
            }
        } else if (keyword == "DWIDTH" && inChar) {
            if (!(ss >> glyph.deviceWidth)) {
                return Err<void>("Malformed DWIDTH at line " + std::to_string(lineNo));
            }
        } else if (keyword == "BBX" && inChar) {
            if (!(ss >> glyph.width >> glyph.height >> glyph.xOffset >> glyph.yOffset) ||
                glyph.width < 0 || glyph.height < 0) {
                return Err<void>("Malformed BBX at line " + std::to_string(lineNo));
            }
            if (glyph.width > MAX_GLYPH_WIDTH || glyph.height > MAX_GLYPH_HEIGHT) {
                return Err<void>("Glyph larger than " + std::to_string(MAX_GLYPH_WIDTH) + "x" +
                                 std::to_string(MAX_GLYPH_HEIGHT) + " at line " +
                                 std::to_string(lineNo));
            }
            haveGlyphBox = true;
        } else if (keyword == "BITMAP" && inChar) {
            if (!haveGlyphBox) {
                return Err<void>("BITMAP before BBX at line " + std::to_string(lineNo));
            }
            if (haveBitmap) {
                return Err<void>("Second BITMAP in glyph at line " + std::to_string(lineNo));
            }
            haveBitmap = true;
            glyph.rows.reserve(glyph.height);
            for (int r = 0; r < glyph.height; ++r) {
                if (!std::getline(file, line)) {
                    return Err<void>("Unexpected end of file in BITMAP");
                }
                ++lineNo;
                if (!line.empty() && line.back() == '\r') line.pop_back();
                uint32_t bits = 0;
                if (!parseBitmapRow(line, bits)) {
                    return Err<void>("Malformed BITMAP row at line " + std::to_string(lineNo));
                }
                glyph.rows.push_back(bits);
            }
        } else if (keyword == "ENDCHAR" && inChar) {
            if (glyph.rows.size() != static_cast<size_t>(glyph.height)) {
                return Err<void>("Glyph has " + std::to_string(glyph.rows.size()) +
                                 " bitmap rows but BBX height " + std::to_string(glyph.height) +
                                 " at line " + std::to_string(lineNo));
            }
            // ENCODING -1 marks glyphs without a standard codepoint
            if (encoding >= 0) {
                _glyphs[static_cast<uint32_t>(encoding)] = std::move(glyph);
            }
            inChar = false;
        } else if (keyword == "ENDFONT") {
            break;
        }
    }

    if (!haveBoundingBox) {
        return Err<void>("Missing FONTBOUNDINGBOX: " + path);
    }
    if (_glyphs.empty()) {
        return Err<void>("Font has no glyphs: " + path);
    }

    _loaded = true;
    ydebug("BdfFont: loaded {} ({} glyphs, height={} baseline={})",
           path, _glyphs.size(), _height, _baseline);
    return Ok();
}

const BdfFont::Glyph* BdfFont::findGlyph(uint32_t codepoint) const {
    auto it = _glyphs.find(codepoint);
    return it != _glyphs.end() ? &it->second : nullptr;
}

int BdfFont::characterWidth(uint32_t codepoint) const {
    const Glyph* g = findGlyph(codepoint);
    return g ? g->deviceWidth : -1;
}

int BdfFont::drawGlyph(int x, int y, uint32_t codepoint, const PixelWriter& writePixel) const {
    const Glyph* g = findGlyph(codepoint);
    if (!g) g = findGlyph(REPLACEMENT_CODEPOINT);
    if (!g) return 0;

    const int top = y - g->yOffset - g->height;
    for (int r = 0; r < g->height; ++r) {
        const uint32_t bits = g->rows[r];
        for (int c = 0; c < g->width; ++c) {
            if (bits & (0x80000000u >> c)) {
                writePixel(x + g->xOffset + c, top + r);
            }
        }
    }
    return g->deviceWidth;
}

} // namespace ledmatrix
