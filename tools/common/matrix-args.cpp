#include "matrix-args.h"
#include <ledmatrix/virtual-driver.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <sstream>

namespace ledmatrix::tools {

MatrixArgs::MatrixArgs(args::ArgumentParser& parser)
    : group(parser, "Panel options:"),
      config(group, "path", "Config file (default: $XDG_CONFIG_HOME/ledmatrix/config.yaml)",
             {'c', "config"}),
      driver(group, "name", "Driver backend: rgb-matrix or virtual", {"driver"}),
      rows(group, "rows", "Panel rows: 8, 16, 32 or 64", {"led-rows"}),
      cols(group, "cols", "Panel columns", {"led-cols"}),
      chain(group, "chain", "Number of daisy-chained panels", {"led-chain"}),
      parallel(group, "parallel", "Parallel chains (1..6)", {"led-parallel"}),
      brightness(group, "percent", "Brightness 0..100", {"led-brightness"}),
      gpioMapping(group, "mapping", "Hardware mapping, e.g. regular or adafruit-hat",
                  {"led-gpio-mapping"}),
      slowdownGpio(group, "factor", "GPIO slowdown for faster Pis", {"led-slowdown-gpio"}),
      showRefresh(group, "show-refresh", "Print the refresh rate", {"led-show-refresh"}),
      noHardwarePulse(group, "no-hardware-pulse", "Do not use hardware pin pulsing",
                      {"led-no-hardware-pulse"}),
      verbose(group, "verbose", "Debug logging", {'v', "verbose"}) {}

YAML::Node MatrixArgs::overrides() {
    YAML::Node cmdOverrides;
    if (driver) cmdOverrides["driver"] = args::get(driver);
    if (rows) cmdOverrides["matrix"]["rows"] = args::get(rows);
    if (cols) cmdOverrides["matrix"]["cols"] = args::get(cols);
    if (chain) cmdOverrides["matrix"]["chain-length"] = args::get(chain);
    if (parallel) cmdOverrides["matrix"]["parallel"] = args::get(parallel);
    if (brightness) cmdOverrides["matrix"]["brightness"] = args::get(brightness);
    if (gpioMapping) cmdOverrides["matrix"]["hardware-mapping"] = args::get(gpioMapping);
    if (showRefresh) cmdOverrides["matrix"]["show-refresh-rate"] = true;
    if (noHardwarePulse) cmdOverrides["matrix"]["hardware-pulsing"] = false;
    if (slowdownGpio) cmdOverrides["runtime"]["gpio-slowdown"] = args::get(slowdownGpio);
    return cmdOverrides;
}

void setupLogging(const MatrixArgs& args) {
    spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

Result<Session> openSession(MatrixArgs& args) {
    std::string configPath = args.config ? args::get(args.config) : "";
    auto config = Config::create(configPath, args.overrides());
    if (!config) {
        return Err<Session>("Failed to create config", config);
    }

    auto options = matrixOptionsFromConfig(**config);
    if (!options) {
        return Err<Session>("Bad panel options", options);
    }
    auto runtimeOptions = runtimeOptionsFromConfig(**config);
    if (!runtimeOptions) {
        return Err<Session>("Bad runtime options", runtimeOptions);
    }

    auto matrix = Matrix::create(*options, *runtimeOptions);
    if (!matrix) {
        return Err<Session>("Failed to create matrix", matrix);
    }
    spdlog::info("{} panel: {}x{}", (*matrix)->driver()->name(), options->width(),
                 options->height());
    return Ok(Session{*config, *matrix});
}

Result<Color> parseColor(const std::string& text) {
    std::istringstream ss(text);
    int channels[3] = {0, 0, 0};
    char sep = 0;
    if (!(ss >> channels[0] >> sep >> channels[1] >> sep >> channels[2]) || !ss.eof()) {
        return Err<Color>("Color must be R,G,B, got '" + text + "'");
    }
    for (int c : channels) {
        if (c < 0 || c > 255) {
            return Err<Color>("Color channel out of range 0..255: " + std::to_string(c));
        }
    }
    return Ok(Color{static_cast<uint8_t>(channels[0]), static_cast<uint8_t>(channels[1]),
                    static_cast<uint8_t>(channels[2])});
}

void printScanOut(const Matrix& matrix) {
    auto virtualDriver = std::dynamic_pointer_cast<VirtualDriver>(matrix.driver());
    if (!virtualDriver) return;

    const int width = matrix.options().width();
    const int height = matrix.options().height();
    const auto frame = virtualDriver->scanOut();

    std::string out;
    out.reserve(static_cast<size_t>(width + 1) * height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            out += frame[static_cast<size_t>(y) * width + x] == COLOR_BLACK ? '.' : '#';
        }
        out += '\n';
    }
    std::cout << out << std::flush;
}

} // namespace ledmatrix::tools
