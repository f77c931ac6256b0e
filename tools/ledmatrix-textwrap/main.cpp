// ledmatrix-textwrap: draw a paragraph wrapped to the panel width
//
// Line breaks are chosen to minimize raggedness; --compare also logs how the
// greedy first-fit breaks would have scored.

#include "../common/matrix-args.h"
#include <ledmatrix/font.h>
#include <ledmatrix/text-draw-options.h>
#include <ledmatrix/text-layout.h>
#include <spdlog/spdlog.h>
#include <args.hxx>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using namespace ledmatrix;

// Raggedness of both breakers for the first paragraph of `text`
static void compareBreakers(const Font& font, const std::string& text, int lineWidth,
                            int kerning) {
    auto width = [&](uint32_t cp) {
        int w = font.characterWidth(cp);
        if (w < 0) w = font.characterWidth(0xFFFD);
        return w < 0 ? 0 : w;
    };

    std::vector<int> words;
    std::istringstream ss(text.substr(0, text.find('\n')));
    std::string word;
    while (ss >> word) {
        const auto codepoints = decodeUtf8(word);
        int w = 0;
        for (uint32_t cp : codepoints) w += width(cp);
        words.push_back(w + static_cast<int>(codepoints.size() - 1) * kerning);
    }
    if (words.empty()) return;

    const int gap = 2 * kerning + width(' ');
    const auto optimal = breakLinesOptimal(words, gap, lineWidth);
    const auto greedy = breakLinesGreedy(words, gap, lineWidth);
    spdlog::info("optimal: {} lines, raggedness {}", optimal.size(),
                 raggedness(words, gap, lineWidth, optimal));
    spdlog::info("greedy:  {} lines, raggedness {}", greedy.size(),
                 raggedness(words, gap, lineWidth, greedy));
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("ledmatrix-textwrap - draw wrapped text on an LED panel");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    tools::MatrixArgs matrixArgs(parser);
    args::ValueFlag<std::string> fontFlag(parser, "bdf", "BDF font file", {'f', "font"});
    args::ValueFlag<std::string> textFlag(parser, "text", "Text to wrap", {'t', "text"},
                                          "To be, or not to be: that is the question");
    args::ValueFlag<std::string> colorFlag(parser, "r,g,b", "Text color", {'C', "color"},
                                           "255,255,255");
    args::ValueFlag<int> widthFlag(parser, "pixels", "Line width (default: panel width)",
                                   {'w', "line-width"});
    args::ValueFlag<int> kerningFlag(parser, "pixels", "Extra pixels between glyphs",
                                     {'k', "kerning"}, 0);
    args::ValueFlag<int> leadingFlag(parser, "pixels", "Extra pixels between lines",
                                     {'l', "leading"}, 0);
    args::Flag compareFlag(parser, "compare", "Log optimal vs greedy raggedness", {"compare"});
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

    auto canvas = matrix->offscreenCanvas();
    if (!canvas) {
        spdlog::error("{}", error_msg(canvas));
        return 1;
    }

    const int lineWidth = widthFlag ? args::get(widthFlag) : canvas->size().width;
    const int kerning = args::get(kerningFlag);
    if (compareFlag) {
        compareBreakers(**font, args::get(textFlag), lineWidth, kerning);
    }

    auto options = TextDrawOptions()
                       .position(0, (*font)->baseline())
                       .color(*color)
                       .layout(Wrapped{lineWidth})
                       .kerningOffset(kerning)
                       .leading(args::get(leadingFlag));

    canvas->clear();
    auto extent = canvas->drawText(**font, args::get(textFlag), options);
    if (!extent) {
        spdlog::error("{}", error_msg(extent));
        return 1;
    }
    spdlog::info("Wrapped text to {}px, {}px tall", lineWidth, *extent);

    auto previous = matrix->swap(std::move(*canvas));
    if (!previous) {
        spdlog::error("{}", error_msg(previous));
        return 1;
    }

    tools::printScanOut(*matrix);
    std::this_thread::sleep_for(std::chrono::seconds(args::get(secondsFlag)));
    return 0;
}
