#pragma once

#include <ledmatrix/color.h>
#include <ledmatrix/text-layout.h>

namespace ledmatrix {

/**
 * TextDrawOptions - how Canvas::drawText places a string.
 *
 * An immutable value: every setter returns a modified copy, so options can be
 * built in one chain and shared freely.
 *
 *   auto opts = TextDrawOptions().position(0, 16).color(red).kerningOffset(1);
 *
 * The color is borrowed and must outlive the options. Binding a temporary
 * does not compile.
 *
 * Defaults: position (0, 0), white, Horizontal, kerning 0, leading 0.
 */
class TextDrawOptions {
public:
    TextDrawOptions() = default;

    // y is the baseline of the first line
    TextDrawOptions position(int x, int y) const {
        TextDrawOptions copy = *this;
        copy._x = x;
        copy._y = y;
        return copy;
    }

    TextDrawOptions color(const Color& color) const {
        TextDrawOptions copy = *this;
        copy._color = &color;
        return copy;
    }
    TextDrawOptions color(const Color&& color) const = delete;

    TextDrawOptions layout(TextLayout layout) const {
        TextDrawOptions copy = *this;
        copy._layout = layout;
        return copy;
    }

    // Extra pixels between consecutive glyphs
    TextDrawOptions kerningOffset(int offset) const {
        TextDrawOptions copy = *this;
        copy._kerningOffset = offset;
        return copy;
    }

    // Extra pixels between wrapped lines
    TextDrawOptions leading(int leading) const {
        TextDrawOptions copy = *this;
        copy._leading = leading;
        return copy;
    }

    int x() const { return _x; }
    int y() const { return _y; }
    const Color& color() const { return *_color; }
    const TextLayout& layout() const { return _layout; }
    int kerningOffset() const { return _kerningOffset; }
    int leading() const { return _leading; }

private:
    int _x = 0;
    int _y = 0;
    const Color* _color = &COLOR_WHITE;
    TextLayout _layout = Horizontal{};
    int _kerningOffset = 0;
    int _leading = 0;
};

} // namespace ledmatrix
