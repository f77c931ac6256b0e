//=============================================================================
// Text Drawing Tests
//
// TextDrawOptions and Canvas::drawText against real BDF fonts on the
// virtual driver
//=============================================================================

#include <cstddef>
#include <version>
#include <concepts>
#include <string>
#include <utility>

#include <boost/ut.hpp>
#include <ledmatrix/font.h>
#include <ledmatrix/text-draw-options.h>
#include "harness/panel_harness.h"

using namespace boost::ut;
using namespace ledmatrix;
using namespace ledmatrix::test;

template<typename T>
concept AcceptsColor = requires(TextDrawOptions options, T&& color) {
    options.color(std::forward<T>(color));
};

// The color is borrowed, so a temporary must not bind
static_assert(AcceptsColor<const Color&>);
static_assert(AcceptsColor<Color&>);
static_assert(!AcceptsColor<Color>);
static_assert(!AcceptsColor<const Color>);

suite text_draw_options_tests = [] {
    "defaults"_test = [] {
        const TextDrawOptions options;
        expect(options.x() == 0_i);
        expect(options.y() == 0_i);
        expect(options.color() == COLOR_WHITE);
        expect(std::holds_alternative<Horizontal>(options.layout()));
        expect(options.kerningOffset() == 0_i);
        expect(options.leading() == 0_i);
    };

    "setters return a new value"_test = [] {
        const Color red{255, 0, 0};
        const TextDrawOptions base;
        const auto derived = base.position(4, 12).color(red).layout(Wrapped{40}).kerningOffset(1)
                                 .leading(2);

        expect(base.x() == 0_i) << "base is untouched";
        expect(base.color() == COLOR_WHITE);

        expect(derived.x() == 4_i);
        expect(derived.y() == 12_i);
        expect(&derived.color() == &red) << "color is borrowed, not copied";
        expect(derived.layout() == TextLayout(Wrapped{40}));
        expect(derived.kerningOffset() == 1_i);
        expect(derived.leading() == 2_i);
    };
};

suite draw_text_tests = [] {
    "Mah boy! on a 64x32 panel"_test = [] {
        PanelHarness panel(32, 64);
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        Canvas& canvas = panel.matrix().canvas();
        canvas.clear();
        auto advance = canvas.drawText(**font, "Mah boy! ", TextDrawOptions().position(0, 16));
        expect(advance.has_value() >> fatal) << error_msg(advance);
        expect(*advance == 90_i);

        // Glyph boxes span columns 1..8 and rows 2..17 of each 10x20 cell
        const Size size = canvas.size();
        for (int y = 0; y < size.height; ++y) {
            for (int x = 0; x < size.width; ++x) {
                const int cell = x / 10;
                const bool inGlyph = y >= 2 && y <= 17 && x % 10 >= 1 && x % 10 <= 8 &&
                                     cell != 3;
                if (!inGlyph) {
                    expect(panel.pixel(canvas, x, y) == COLOR_BLACK) << "pixel" << x << y;
                }
            }
        }
        for (int cell : {0, 1, 2, 4, 5}) {
            expect(panel.pixel(canvas, cell * 10 + 1, 2) == COLOR_WHITE) << "cell" << cell;
            expect(panel.pixel(canvas, cell * 10 + 8, 17) == COLOR_WHITE) << "cell" << cell;
        }
        expect(panel.pixel(canvas, 35, 10) == COLOR_BLACK) << "space cell stays dark";
    };

    "horizontal advance with kerning"_test = [] {
        PanelHarness panel(32, 64);
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), propFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        const std::string text = "kerning";
        int sum = 0;
        for (char c : text) sum += (*font)->characterWidth(static_cast<uint8_t>(c));

        for (int kerning : {0, 1, 2, -1}) {
            auto advance = panel.matrix().canvas().drawText(
                **font, text, TextDrawOptions().position(0, 8).kerningOffset(kerning));
            expect(advance.has_value() >> fatal);
            expect(*advance == sum + 6 * kerning) << "kerning" << kerning;
        }
    };

    "text is drawn in the option color"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        const Color green{0, 255, 0};
        Canvas& canvas = panel.matrix().canvas();
        auto advance = canvas.drawText(**font, "A", TextDrawOptions().position(0, 16).color(green));
        expect(advance.has_value() >> fatal);
        expect(panel.pixel(canvas, 1, 2) == green);
    };

    "vertical text returns its height"_test = [] {
        PanelHarness panel(64, 32);
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), propFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        auto advance = panel.matrix().canvas().drawText(
            **font, "abc", TextDrawOptions().position(0, 8).layout(Vertical{}).kerningOffset(1));
        expect(advance.has_value() >> fatal);
        expect(*advance == 3 * 10 + 2 * 1);
    };

    "wrapped text stays inside the line width"_test = [] {
        PanelHarness panel(32, 64);
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), propFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        Canvas& canvas = panel.matrix().canvas();
        auto extent = canvas.drawText(**font, "To be, or not to be: that is the question",
                                      TextDrawOptions().position(0, 8).layout(Wrapped{40}));
        expect(extent.has_value() >> fatal) << error_msg(extent);
        expect(*extent > 10) << "more than one line";
        expect((*extent - 10) % 10 == 0_i) << "whole lines, no leading";
        expect(panel.litOnlyWithin(canvas, 0, 0, 40, 32));
        expect(panel.litPixels(canvas) > 0_ul);
    };

    "missing glyphs are measured as the replacement glyph"_test = [] {
        PanelHarness panel(32, 64);
        expect(panel.ok() >> fatal) << panel.error();
        auto mono = Font::create(panel.matrix().driver(), monoFont());
        auto prop = Font::create(panel.matrix().driver(), propFont());
        expect((mono.has_value() && prop.has_value()) >> fatal);

        Canvas& canvas = panel.matrix().canvas();
        // U+263A is in neither font; mono has U+FFFD, prop has none
        auto withReplacement = canvas.drawText(**mono, "a☺b", TextDrawOptions());
        auto withoutReplacement = canvas.drawText(**prop, "a☺b", TextDrawOptions());
        expect((withReplacement.has_value() && withoutReplacement.has_value()) >> fatal);
        expect(*withReplacement == 30_i);
        expect(*withoutReplacement == (*prop)->characterWidth('a') + (*prop)->characterWidth('b'));
    };

    "moved-from canvas draws nothing"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);
        auto offscreen = panel.matrix().offscreenCanvas();
        expect(offscreen.has_value() >> fatal);

        Canvas kept = std::move(*offscreen);
        auto advance = offscreen->drawText(**font, "ab", TextDrawOptions().position(0, 16));
        expect(advance.has_value() >> fatal);
        expect(*advance == 20_i);
        expect(panel.litPixels(kept) == 0_ul);
    };
};

suite draw_text_error_tests = [] {
    "embedded NUL is an error, not a crash"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        Canvas& canvas = panel.matrix().canvas();
        auto advance = canvas.drawText(**font, std::string("ab\0cd", 5), TextDrawOptions());
        expect(!advance.has_value());
        expect(error_msg(advance).find("NUL") != std::string::npos) << error_msg(advance);
        expect(panel.litPixels(canvas) == 0_ul) << "nothing drawn";
    };

    "font from another session is rejected"_test = [] {
        PanelHarness first;
        PanelHarness second;
        expect((first.ok() && second.ok()) >> fatal);
        auto font = Font::create(first.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        auto advance = second.matrix().canvas().drawText(**font, "A",
                                                         TextDrawOptions().position(0, 16));
        expect(!advance.has_value());
        expect(second.litPixels(second.matrix().canvas()) == 0_ul);
    };

    "non-positive wrap width is rejected"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        for (int lineWidth : {0, -1}) {
            auto advance = panel.matrix().canvas().drawText(
                **font, "some text", TextDrawOptions().layout(Wrapped{lineWidth}));
            expect(!advance.has_value()) << "line width" << lineWidth;
        }
    };
};
