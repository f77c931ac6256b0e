// ledmatrix-text: draw one line of text with a BDF font
//
// The text is drawn into an off-screen canvas with its baseline at the font
// height (or --y) and swapped in. On the virtual driver the frame is printed.

#include "../common/matrix-args.h"
#include <ledmatrix/font.h>
#include <ledmatrix/text-draw-options.h>
#include <spdlog/spdlog.h>
#include <args.hxx>
#include <chrono>
#include <iostream>
#include <thread>

using namespace ledmatrix;

int main(int argc, char** argv) {
    args::ArgumentParser parser("ledmatrix-text - draw a line of text on an LED panel");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    tools::MatrixArgs matrixArgs(parser);
    args::ValueFlag<std::string> fontFlag(parser, "bdf", "BDF font file", {'f', "font"});
    args::ValueFlag<std::string> textFlag(parser, "text", "Text to draw", {'t', "text"},
                                          "Hello World");
    args::ValueFlag<std::string> colorFlag(parser, "r,g,b", "Text color", {'C', "color"},
                                           "255,255,255");
    args::ValueFlag<int> xFlag(parser, "x", "Left edge", {'x'}, 0);
    args::ValueFlag<int> yFlag(parser, "y", "Baseline (default: font height)", {'y'});
    args::ValueFlag<int> kerningFlag(parser, "pixels", "Extra pixels between glyphs",
                                     {'k', "kerning"}, 0);
    args::Flag verticalFlag(parser, "vertical", "Stack glyphs top to bottom", {"vertical"});
    args::ValueFlag<int> secondsFlag(parser, "seconds", "How long to show the text",
                                     {'s', "seconds"}, 5);

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    tools::setupLogging(matrixArgs);

    if (!fontFlag) {
        std::cerr << "Error: no font specified (--font)\n";
        return 1;
    }

    auto color = tools::parseColor(args::get(colorFlag));
    if (!color) {
        std::cerr << "Error: " << error_msg(color) << "\n";
        return 1;
    }

    auto session = tools::openSession(matrixArgs);
    if (!session) {
        spdlog::error("{}", error_msg(session));
        return 1;
    }
    auto& matrix = session->matrix;

    auto font = Font::create(matrix->driver(), args::get(fontFlag));
    if (!font) {
        spdlog::error("{}", error_msg(font));
        return 1;
    }

    auto height = (*font)->height();
    if (!height) {
        spdlog::error("{}", error_msg(height));
        return 1;
    }

    auto canvas = matrix->offscreenCanvas();
    if (!canvas) {
        spdlog::error("{}", error_msg(canvas));
        return 1;
    }

    const int baseline = yFlag ? args::get(yFlag) : *height;
    auto options = TextDrawOptions()
                       .position(args::get(xFlag), baseline)
                       .color(*color)
                       .kerningOffset(args::get(kerningFlag));
    if (verticalFlag) {
        options = options.layout(Vertical{});
    }

    canvas->clear();
    auto advance = canvas->drawText(**font, args::get(textFlag), options);
    if (!advance) {
        spdlog::error("{}", error_msg(advance));
        return 1;
    }
    spdlog::info("Drew '{}' with advance {}", args::get(textFlag), *advance);

    auto previous = matrix->swap(std::move(*canvas));
    if (!previous) {
        spdlog::error("{}", error_msg(previous));
        return 1;
    }

    tools::printScanOut(*matrix);
    std::this_thread::sleep_for(std::chrono::seconds(args::get(secondsFlag)));
    return 0;
}
