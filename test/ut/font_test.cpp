//=============================================================================
// Font Tests
//
// BDF loading, metrics and release through the virtual driver
//=============================================================================

#include <cstddef>
#include <version>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/ut.hpp>
#include <ledmatrix/font.h>
#include <ledmatrix/text-draw-options.h>
#include "harness/panel_harness.h"
#include "harness/unloaded_font_driver.h"

using namespace boost::ut;
using namespace ledmatrix;
using namespace ledmatrix::test;

suite font_load_tests = [] {
    "well-formed font loads with sane metrics"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        auto font = Font::create(panel.matrix().driver(), monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        auto height = (*font)->height();
        expect(height.has_value() >> fatal);
        expect(*height == 20_i);
        expect((*font)->baseline() == 16_i);
        expect((*font)->baseline() > 0 && (*font)->baseline() < *height);
    };

    "proportional font metrics"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        auto font = Font::create(panel.matrix().driver(), propFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        expect(*(*font)->height() == 10_i);
        expect((*font)->baseline() == 8_i);
        expect((*font)->characterWidth('i') == 3_i);  // 105 % 5 == 0
        expect((*font)->characterWidth('m') == 7_i);  // 109 % 5 == 4
        expect((*font)->characterWidth(' ') == 4_i);
    };

    "missing glyph width is -1"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        auto font = Font::create(panel.matrix().driver(), propFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        expect((*font)->characterWidth(0x263A) == -1_i);
    };

    "nonexistent path fails and leaves nothing behind"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        auto font = Font::create(panel.matrix().driver(), "/nonexistent/font.bdf");
        expect(!font.has_value());
        expect(error_msg(font).find("not found") != std::string::npos) << error_msg(font);
        expect(panel.driver().fontCount() == 0_ul);
    };

    "malformed font is rejected by the driver"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        auto font = Font::create(panel.matrix().driver(), brokenFont());
        expect(!font.has_value());
        expect(error_msg(font).find("BITMAP") != std::string::npos) << error_msg(font);
        expect(panel.driver().fontCount() == 0_ul);
    };

    "glyph structure is validated on load"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        const std::vector<std::pair<std::string, std::string>> cases = {
            {"bitmap-before-bbx.bdf", "BITMAP before BBX"},
            {"short-bitmap.bdf", "bitmap rows but BBX height"},
            {"huge-glyph.bdf", "Glyph larger than"},
            {"bare-encoding.bdf", "Malformed ENCODING"},
        };
        for (const auto& [file, reason] : cases) {
            auto font = Font::create(panel.matrix().driver(), fontFixture(file));
            expect(!font.has_value()) << file;
            expect(error_msg(font).find(reason) != std::string::npos) << error_msg(font);
        }
        expect(panel.driver().fontCount() == 0_ul);
    };

    "path with embedded NUL is an error"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();

        const std::string path = monoFont() + std::string("\0.bdf", 5);
        auto font = Font::create(panel.matrix().driver(), path);
        expect(!font.has_value());
        expect(error_msg(font).find("NUL") != std::string::npos) << error_msg(font);
    };

    "missing driver is an error"_test = [] {
        auto font = Font::create(nullptr, monoFont());
        expect(!font.has_value());
    };
};

suite font_lifetime_tests = [] {
    "font is released exactly once"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        {
            auto font = Font::create(panel.matrix().driver(), monoFont());
            expect(font.has_value() >> fatal) << error_msg(font);
            expect(panel.driver().fontCount() == 1_ul);

            Font::Ptr shared = *font;
            font = Font::create(panel.matrix().driver(), propFont());
            expect(panel.driver().fontCount() == 2_ul) << "first font still referenced";
        }
        expect(panel.driver().fontCount() == 0_ul);
    };

    "font keeps the session alive"_test = [] {
        Font::Ptr font;
        {
            PanelHarness panel;
            expect(panel.ok() >> fatal) << panel.error();
            auto res = Font::create(panel.matrix().driver(), monoFont());
            expect(res.has_value() >> fatal) << error_msg(res);
            font = *res;
        }
        expect(*font->height() == 20_i);
        expect(font->characterWidth('A') == 10_i);
    };

    "font can be shared across threads"_test = [] {
        PanelHarness panel;
        expect(panel.ok() >> fatal) << panel.error();
        auto res = Font::create(panel.matrix().driver(), monoFont());
        expect(res.has_value() >> fatal) << error_msg(res);
        Font::Ptr font = *res;

        std::vector<int> widths(4, 0);
        std::vector<std::thread> workers;
        for (size_t i = 0; i < widths.size(); ++i) {
            workers.emplace_back([font, &widths, i] {
                for (uint32_t cp = 32; cp < 127; ++cp) widths[i] += font->characterWidth(cp);
            });
        }
        for (auto& w : workers) w.join();

        for (int w : widths) {
            expect(w == 950_i);
        }
    };
};

suite font_sentinel_tests = [] {
    "not-loaded height becomes an error"_test = [] {
        MatrixOptions options;
        RuntimeOptions runtime;
        expect(runtime.setDriver(RuntimeOptions::DRIVER_VIRTUAL).has_value() >> fatal);
        auto panel = VirtualDriver::create(options, runtime);
        expect(panel.has_value() >> fatal) << error_msg(panel);

        auto driver = std::make_shared<UnloadedFontDriver>(*panel);
        auto matrix = Matrix::create(driver, options, runtime);
        expect(matrix.has_value() >> fatal) << error_msg(matrix);

        auto font = Font::create(driver, monoFont());
        expect(font.has_value() >> fatal) << error_msg(font);

        auto height = (*font)->height();
        expect(!height.has_value());
        expect(error_msg(height).find("not loaded") != std::string::npos) << error_msg(height);

        Canvas& canvas = (*matrix)->canvas();
        auto advance = canvas.drawText(**font, "A", TextDrawOptions().position(0, 16));
        expect(!advance.has_value());
        expect(error_msg(advance).find("not loaded") != std::string::npos) << error_msg(advance);

        auto live = driver->panel().readPixel(canvas.native(), 1, 2);
        expect((live.has_value() && *live == COLOR_BLACK)) << "nothing drawn";
    };
};
