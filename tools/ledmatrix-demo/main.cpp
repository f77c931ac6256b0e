// ledmatrix-demo: canvas primitives and the double-buffer loop
//
// Scenes:
//   lines     fan of lines across the live canvas
//   circles   concentric circles from the center
//   gradient  full-panel color cycle
//   swap      two off-screen frames swapped back and forth
//   scroll    text scrolling right to left, one swap per frame (needs --font)

#include "../common/matrix-args.h"
#include <ledmatrix/font.h>
#include <ledmatrix/text-draw-options.h>
#include <spdlog/spdlog.h>
#include <args.hxx>
#include <chrono>
#include <cmath>
#include <iostream>
#include <numbers>
#include <thread>

using namespace ledmatrix;
using namespace std::chrono_literals;

static void lines(Matrix& matrix) {
    Canvas& canvas = matrix.canvas();
    const Size size = canvas.size();
    Color color{127, 0, 0};

    canvas.clear();
    for (int x = 0; x < size.width; ++x) {
        color.blue = static_cast<uint8_t>(255 - 3 * x);
        canvas.drawLine(x, 0, size.width - 1 - x, size.height - 1, color);
        std::this_thread::sleep_for(10ms);
    }
}

static void circles(Matrix& matrix) {
    Canvas& canvas = matrix.canvas();
    const Size size = canvas.size();
    Color color{127, 0, 0};

    canvas.clear();
    for (int r = 0; r < size.width / 2; ++r) {
        color.green = color.red;
        color.red = color.blue;
        color.blue = static_cast<uint8_t>(r * r);
        canvas.drawCircle(size.width / 2, size.height / 2, static_cast<uint32_t>(r), color);
        std::this_thread::sleep_for(100ms);
    }
}

static void gradient(Matrix& matrix) {
    Canvas& canvas = matrix.canvas();
    constexpr int PERIOD = 400;
    constexpr auto STEP = std::chrono::milliseconds(3000) / PERIOD;

    for (int t = 0; t < PERIOD; ++t) {
        const double phase = std::numbers::pi * t / PERIOD;
        Color color;
        color.red = static_cast<uint8_t>(std::sin(phase) * 255.0);
        color.green = static_cast<uint8_t>(std::fabs(std::cos(2.0 * phase)) * 255.0);
        color.blue = static_cast<uint8_t>(std::fabs(std::cos(3.0 * phase + 0.3)) * 255.0);
        canvas.fill(color);
        std::this_thread::sleep_for(STEP);
    }
}

static Result<void> swapFrames(Matrix& matrix) {
    Color color{127, 127, 0};
    matrix.canvas().fill(color);

    auto offscreen = matrix.offscreenCanvas();
    if (!offscreen) {
        return Err<void>("swap scene", offscreen);
    }
    Canvas canvas = std::move(*offscreen);

    color.blue = 127;
    canvas.fill(color);
    std::this_thread::sleep_for(500ms);

    auto previous = matrix.swap(std::move(canvas));
    if (!previous) {
        return Err<void>("swap scene", previous);
    }
    canvas = std::move(*previous);

    color.red = 0;
    canvas.fill(color);
    std::this_thread::sleep_for(500ms);

    if (auto res = matrix.swap(std::move(canvas)); !res) {
        return Err<void>("swap scene", res);
    }
    std::this_thread::sleep_for(500ms);
    return Ok();
}

static Result<void> scroll(Matrix& matrix, const Font& font, const std::string& text,
                           int frames) {
    auto offscreen = matrix.offscreenCanvas();
    if (!offscreen) {
        return Err<void>("scroll scene", offscreen);
    }
    Canvas canvas = std::move(*offscreen);

    const Size size = canvas.size();
    const Color color{0, 200, 255};
    const int baseline = (size.height + font.baseline()) / 2;
    int x = size.width;

    for (int frame = 0; frame < frames; ++frame) {
        canvas.clear();
        auto advance = canvas.drawText(font, text,
                                       TextDrawOptions().position(x, baseline).color(color));
        if (!advance) {
            return Err<void>("scroll scene", advance);
        }
        if (--x + *advance < 0) {
            x = size.width;
        }

        auto previous = matrix.swap(std::move(canvas));
        if (!previous) {
            return Err<void>("scroll scene", previous);
        }
        canvas = std::move(*previous);
        std::this_thread::sleep_for(30ms);
    }
    return Ok();
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("ledmatrix-demo - canvas primitives and double buffering");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    tools::MatrixArgs matrixArgs(parser);
    args::ValueFlag<std::string> sceneFlag(parser, "scene",
                                           "lines, circles, gradient, swap, scroll or all",
                                           {"scene"}, "all");
    args::ValueFlag<std::string> fontFlag(parser, "bdf", "BDF font for the scroll scene",
                                          {'f', "font"});
    args::ValueFlag<std::string> textFlag(parser, "text", "Scrolling text", {'t', "text"},
                                          "Mah boy! ");
    args::ValueFlag<int> framesFlag(parser, "frames", "Frames of the scroll scene",
                                    {"frames"}, 300);

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

    auto session = tools::openSession(matrixArgs);
    if (!session) {
        spdlog::error("{}", error_msg(session));
        return 1;
    }
    Matrix& matrix = *session->matrix;

    const std::string scene = args::get(sceneFlag);
    const bool all = scene == "all";

    if (all || scene == "lines") {
        spdlog::info("scene: lines");
        lines(matrix);
    }
    if (all || scene == "circles") {
        spdlog::info("scene: circles");
        circles(matrix);
    }
    if (all || scene == "gradient") {
        spdlog::info("scene: gradient");
        gradient(matrix);
    }
    if (all || scene == "swap") {
        spdlog::info("scene: swap");
        if (auto res = swapFrames(matrix); !res) {
            spdlog::error("{}", error_msg(res));
            return 1;
        }
    }
    if (all || scene == "scroll") {
        if (!fontFlag) {
            if (!all) {
                std::cerr << "Error: the scroll scene needs --font\n";
                return 1;
            }
            spdlog::warn("scene: scroll skipped, no --font");
        } else {
            spdlog::info("scene: scroll");
            auto font = Font::create(matrix.driver(), args::get(fontFlag));
            if (!font) {
                spdlog::error("{}", error_msg(font));
                return 1;
            }
            if (auto res = scroll(matrix, **font, args::get(textFlag), args::get(framesFlag));
                !res) {
                spdlog::error("{}", error_msg(res));
                return 1;
            }
        }
    }

    tools::printScanOut(matrix);
    spdlog::info("{} swaps", matrix.swapCount());
    return 0;
}
