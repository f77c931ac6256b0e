#pragma once

#include <ledmatrix/config.h>
#include <ledmatrix/matrix-options.h>
#include <ledmatrix/matrix.h>
#include <ledmatrix/result.hpp>
#include <args.hxx>
#include <yaml-cpp/yaml.h>
#include <string>

namespace ledmatrix::tools {

// Panel flags shared by every ledmatrix-* tool. Given flags become command
// line overrides of the Config, so they win over the file and environment.
struct MatrixArgs {
    explicit MatrixArgs(args::ArgumentParser& parser);

    args::Group group;
    args::ValueFlag<std::string> config;
    args::ValueFlag<std::string> driver;
    args::ValueFlag<int> rows;
    args::ValueFlag<int> cols;
    args::ValueFlag<int> chain;
    args::ValueFlag<int> parallel;
    args::ValueFlag<int> brightness;
    args::ValueFlag<std::string> gpioMapping;
    args::ValueFlag<int> slowdownGpio;
    args::Flag showRefresh;
    args::Flag noHardwarePulse;
    args::Flag verbose;

    YAML::Node overrides();
};

struct Session {
    Config::Ptr config;
    Matrix::Ptr matrix;
};

// spdlog level from --verbose
void setupLogging(const MatrixArgs& args);

// Config -> options -> Matrix
Result<Session> openSession(MatrixArgs& args);

// "255,0,128"
Result<Color> parseColor(const std::string& text);

// Prints the live frame as text when the session runs on the virtual driver
void printScanOut(const Matrix& matrix);

} // namespace ledmatrix::tools
