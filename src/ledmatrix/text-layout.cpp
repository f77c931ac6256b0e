#include <ledmatrix/text-layout.h>
#include <ytrace/ytrace.hpp>
#include <limits>

namespace ledmatrix {

//-----------------------------------------------------------------------------
// UTF-8
//-----------------------------------------------------------------------------

// Malformed input (bad lead byte, missing or stray continuation byte,
// overlong form, surrogate) decodes to U+FFFD and consumes one byte
static uint32_t decodeCodepoint(const uint8_t*& ptr, const uint8_t* end) {
    constexpr uint32_t REPLACEMENT = 0xFFFD;
    const uint8_t lead = *ptr;

    int extra = 0;
    uint32_t codepoint = 0;
    uint32_t minimum = 0;
    if ((lead & 0x80) == 0) {
        ++ptr;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        codepoint = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        codepoint = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        codepoint = lead & 0x07;
        minimum = 0x10000;
    } else {
        ++ptr;
        return REPLACEMENT;
    }

    if (end - ptr <= extra) {
        ++ptr;
        return REPLACEMENT;
    }
    for (int i = 1; i <= extra; ++i) {
        if ((ptr[i] & 0xC0) != 0x80) {
            ++ptr;
            return REPLACEMENT;
        }
        codepoint = (codepoint << 6) | (ptr[i] & 0x3F);
    }
    if (codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        ++ptr;
        return REPLACEMENT;
    }
    ptr += extra + 1;
    return codepoint;
}

std::vector<uint32_t> decodeUtf8(std::string_view text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());
    const auto* ptr = reinterpret_cast<const uint8_t*>(text.data());
    const auto* end = ptr + text.size();
    while (ptr < end) {
        out.push_back(decodeCodepoint(ptr, end));
    }
    return out;
}

//-----------------------------------------------------------------------------
// Line breaking
//-----------------------------------------------------------------------------

int lineWidthOf(const std::vector<int>& wordWidths, int gap, size_t first, size_t last) {
    int width = 0;
    for (size_t i = first; i <= last; ++i) {
        width += wordWidths[i];
    }
    return width + static_cast<int>(last - first) * gap;
}

std::vector<size_t> breakLinesOptimal(const std::vector<int>& wordWidths, int gap, int lineWidth) {
    const size_t n = wordWidths.size();
    if (n == 0) return {};

    // best[i]: minimal cost of laying out words [i, n); next[i]: first word
    // of the line after the one starting at i
    constexpr int64_t INF = std::numeric_limits<int64_t>::max();
    std::vector<int64_t> best(n + 1, INF);
    std::vector<size_t> next(n + 1, n);
    best[n] = 0;

    for (size_t i = n; i-- > 0;) {
        int width = -gap;
        for (size_t j = i; j < n; ++j) {
            width += gap + wordWidths[j];
            if (width > lineWidth && j > i) break;

            int64_t cost = 0;
            if (j + 1 < n && width <= lineWidth) {
                const int64_t slack = lineWidth - width;
                cost = slack * slack;
            }
            if (best[j + 1] != INF && cost + best[j + 1] < best[i]) {
                best[i] = cost + best[j + 1];
                next[i] = j + 1;
            }
            if (width > lineWidth) break;  // oversized word, alone
        }
    }

    std::vector<size_t> starts;
    for (size_t i = 0; i < n; i = next[i]) {
        starts.push_back(i);
    }
    return starts;
}

std::vector<size_t> breakLinesGreedy(const std::vector<int>& wordWidths, int gap, int lineWidth) {
    std::vector<size_t> starts;
    int width = 0;
    for (size_t i = 0; i < wordWidths.size(); ++i) {
        if (starts.empty() || width + gap + wordWidths[i] > lineWidth) {
            starts.push_back(i);
            width = wordWidths[i];
        } else {
            width += gap + wordWidths[i];
        }
    }
    return starts;
}

int64_t raggedness(const std::vector<int>& wordWidths, int gap, int lineWidth,
                   const std::vector<size_t>& lineStarts) {
    int64_t total = 0;
    for (size_t line = 0; line + 1 < lineStarts.size(); ++line) {
        const int width = lineWidthOf(wordWidths, gap, lineStarts[line], lineStarts[line + 1] - 1);
        if (width <= lineWidth) {
            const int64_t slack = lineWidth - width;
            total += slack * slack;
        }
    }
    return total;
}

//-----------------------------------------------------------------------------
// Layout
//-----------------------------------------------------------------------------

namespace {

struct Word {
    std::vector<uint32_t> codepoints;
    int width = 0;
};

using Paragraph = std::vector<Word>;

bool isWordSeparator(uint32_t cp) { return cp == ' ' || cp == '\t'; }

std::vector<Paragraph> splitParagraphs(const std::vector<uint32_t>& codepoints,
                                       const GlyphWidthFn& glyphWidth, int kerning) {
    std::vector<Paragraph> paragraphs(1);
    Word current;

    auto flushWord = [&]() {
        if (current.codepoints.empty()) return;
        int width = 0;
        for (uint32_t cp : current.codepoints) width += glyphWidth(cp);
        current.width = width + static_cast<int>(current.codepoints.size() - 1) * kerning;
        paragraphs.back().push_back(std::move(current));
        current = Word{};
    };

    for (uint32_t cp : codepoints) {
        if (cp == '\r') continue;
        if (cp == '\n') {
            flushWord();
            paragraphs.emplace_back();
        } else if (isWordSeparator(cp)) {
            flushWord();
        } else {
            current.codepoints.push_back(cp);
        }
    }
    flushWord();
    return paragraphs;
}

LaidOutText layoutHorizontal(const std::vector<uint32_t>& codepoints, int x, int y,
                             const TextMetrics& metrics, const GlyphWidthFn& glyphWidth) {
    LaidOutText out;
    out.glyphs.reserve(codepoints.size());
    int cursor = x;
    for (size_t i = 0; i < codepoints.size(); ++i) {
        if (i > 0) cursor += metrics.kerningOffset;
        out.glyphs.push_back({codepoints[i], cursor, y});
        cursor += glyphWidth(codepoints[i]);
    }
    out.advance = cursor - x;
    out.lines = codepoints.empty() ? 0 : 1;
    return out;
}

LaidOutText layoutVertical(const std::vector<uint32_t>& codepoints, int x, int y,
                           const TextMetrics& metrics) {
    LaidOutText out;
    out.glyphs.reserve(codepoints.size());
    const int step = metrics.fontHeight + metrics.kerningOffset;
    for (size_t i = 0; i < codepoints.size(); ++i) {
        out.glyphs.push_back({codepoints[i], x, y + static_cast<int>(i) * step});
    }
    const int k = static_cast<int>(codepoints.size());
    out.advance = k == 0 ? 0 : k * metrics.fontHeight + (k - 1) * metrics.kerningOffset;
    out.lines = k == 0 ? 0 : 1;
    return out;
}

LaidOutText layoutWrapped(const std::vector<uint32_t>& codepoints, int lineWidth, int x, int y,
                          const TextMetrics& metrics, const GlyphWidthFn& glyphWidth) {
    LaidOutText out;
    if (codepoints.empty()) return out;

    const int kerning = metrics.kerningOffset;
    const int spaceWidth = glyphWidth(' ');
    const int gap = kerning + spaceWidth + kerning;
    const int lineStep = metrics.fontHeight + metrics.leading;

    int line = 0;
    for (const auto& paragraph : splitParagraphs(codepoints, glyphWidth, kerning)) {
        if (paragraph.empty()) {
            ++line;
            continue;
        }

        std::vector<int> widths;
        widths.reserve(paragraph.size());
        for (const auto& word : paragraph) widths.push_back(word.width);

        const auto starts = breakLinesOptimal(widths, gap, lineWidth);
        for (size_t l = 0; l < starts.size(); ++l) {
            const size_t first = starts[l];
            const size_t last = l + 1 < starts.size() ? starts[l + 1] : paragraph.size();
            const int baseline = y + line * lineStep;

            int cursor = x;
            for (size_t w = first; w < last; ++w) {
                if (w > first) cursor += spaceWidth + kerning;
                for (uint32_t cp : paragraph[w].codepoints) {
                    out.glyphs.push_back({cp, cursor, baseline});
                    cursor += glyphWidth(cp) + kerning;
                }
            }
            ++line;
        }
    }

    out.lines = line;
    out.advance = line * metrics.fontHeight + (line - 1) * metrics.leading;
    return out;
}

} // namespace

Result<LaidOutText> layoutText(std::string_view text, const TextLayout& layout, int x, int y,
                               const TextMetrics& metrics, const GlyphWidthFn& glyphWidth) {
    const auto codepoints = decodeUtf8(text);

    if (std::holds_alternative<Horizontal>(layout)) {
        return Ok(layoutHorizontal(codepoints, x, y, metrics, glyphWidth));
    }
    if (std::holds_alternative<Vertical>(layout)) {
        return Ok(layoutVertical(codepoints, x, y, metrics));
    }

    const int lineWidth = std::get<Wrapped>(layout).lineWidth;
    if (lineWidth <= 0) {
        return Err<LaidOutText>("Wrapped layout needs a positive line width, got " +
                                std::to_string(lineWidth));
    }
    auto out = layoutWrapped(codepoints, lineWidth, x, y, metrics, glyphWidth);
    ydebug("layoutText: {} glyphs wrapped into {} lines of {}px", out.glyphs.size(), out.lines,
           lineWidth);
    return Ok(std::move(out));
}

} // namespace ledmatrix
