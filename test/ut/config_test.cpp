//=============================================================================
// Config Tests
//
// Layering of defaults, YAML file, environment and command line, and the
// conversion of a Config into validated options
//=============================================================================

#include <cstddef>
#include <version>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include <boost/ut.hpp>
#include <ledmatrix/config.h>
#include <ledmatrix/matrix-options.h>

using namespace boost::ut;
using namespace ledmatrix;

namespace fs = std::filesystem;

namespace {

// Writes a YAML file under a private temp dir and points XDG_CONFIG_HOME
// there so a user config never leaks into the tests
class ConfigDir {
public:
    ConfigDir() {
        _dir = fs::temp_directory_path() / ("ledmatrix-config-test-" + std::to_string(::getpid()));
        fs::create_directories(_dir);
        ::setenv("XDG_CONFIG_HOME", _dir.c_str(), 1);
    }

    ~ConfigDir() {
        std::error_code ec;
        fs::remove_all(_dir, ec);
        ::unsetenv("XDG_CONFIG_HOME");
    }

    std::string write(const std::string& name, const std::string& yaml) const {
        const fs::path path = _dir / name;
        std::ofstream out(path);
        out << yaml;
        return path.string();
    }

private:
    fs::path _dir;
};

struct ScopedEnv {
    ScopedEnv(const char* name, const char* value) : _name(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(_name); }
    const char* _name;
};

} // namespace

suite config_layer_tests = [] {
    "defaults match the option classes"_test = [] {
        ConfigDir dir;
        auto config = Config::create();
        expect(config.has_value() >> fatal) << error_msg(config);

        const MatrixOptions matrix;
        expect((*config)->get<int>(Config::KEY_ROWS) == matrix.rows());
        expect((*config)->get<int>(Config::KEY_CHAIN_LENGTH) == matrix.chainLength());
        expect((*config)->get<std::string>(Config::KEY_HARDWARE_MAPPING) ==
               matrix.hardwareMapping());
        expect((*config)->get<bool>(Config::KEY_HARDWARE_PULSING) == true);
        expect((*config)->get<std::string>(Config::KEY_DRIVER) ==
               std::string(RuntimeOptions::defaultDriver()));
        expect(!(*config)->has("matrix/no-such-key"));
        expect((*config)->get<int>("matrix/no-such-key", 7) == 7_i);
    };

    "file values override defaults"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("panel.yaml",
                                    "matrix:\n"
                                    "  rows: 16\n"
                                    "  chain-length: 2\n"
                                    "runtime:\n"
                                    "  gpio-slowdown: 3\n");
        auto config = Config::create(path);
        expect(config.has_value() >> fatal) << error_msg(config);

        expect((*config)->get<int>(Config::KEY_ROWS) == 16);
        expect((*config)->get<int>(Config::KEY_CHAIN_LENGTH) == 2);
        expect((*config)->get<int>(Config::KEY_COLS) == 32) << "untouched keys keep defaults";
        expect((*config)->get<int>(Config::KEY_GPIO_SLOWDOWN) == 3);
    };

    "XDG config file is picked up"_test = [] {
        ConfigDir dir;
        fs::create_directories(Config::getXDGConfigPath().parent_path());
        {
            std::ofstream out(Config::getXDGConfigPath());
            out << "matrix:\n  brightness: 42\n";
        }

        auto config = Config::create();
        expect(config.has_value() >> fatal) << error_msg(config);
        expect((*config)->get<int>(Config::KEY_BRIGHTNESS) == 42);
    };

    "environment overrides the file"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("panel.yaml", "matrix:\n  chain-length: 2\n");
        ScopedEnv env("LEDMATRIX_MATRIX_CHAIN_LENGTH", "3");

        auto config = Config::create(path);
        expect(config.has_value() >> fatal) << error_msg(config);
        expect((*config)->get<int>(Config::KEY_CHAIN_LENGTH) == 3);
    };

    "command line overrides the environment"_test = [] {
        ConfigDir dir;
        ScopedEnv env("LEDMATRIX_MATRIX_CHAIN_LENGTH", "3");

        YAML::Node overrides;
        overrides["matrix"]["chain-length"] = 4;
        overrides["driver"] = "virtual";
        auto config = Config::create("", overrides);
        expect(config.has_value() >> fatal) << error_msg(config);
        expect((*config)->get<int>(Config::KEY_CHAIN_LENGTH) == 4);
        expect((*config)->get<int>(Config::KEY_ROWS) == 32) << "siblings survive the merge";
    };

    "explicit path must exist"_test = [] {
        ConfigDir dir;
        auto config = Config::create("/nonexistent/ledmatrix.yaml");
        expect(!config.has_value());
        expect(error_msg(config).find("/nonexistent/ledmatrix.yaml") != std::string::npos);
    };

    "malformed YAML is reported"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("broken.yaml", "matrix: [rows: 16\n");
        auto config = Config::create(path);
        expect(!config.has_value());
        expect(error_msg(config).find("YAML") != std::string::npos) << error_msg(config);
    };
};

suite config_options_tests = [] {
    "options are read from the config"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("panel.yaml",
                                    "driver: virtual\n"
                                    "matrix:\n"
                                    "  rows: 16\n"
                                    "  cols: 64\n"
                                    "  hardware-mapping: adafruit-hat\n"
                                    "  inverse-colors: true\n"
                                    "runtime:\n"
                                    "  daemon: true\n");
        auto config = Config::create(path);
        expect(config.has_value() >> fatal) << error_msg(config);

        auto matrix = matrixOptionsFromConfig(**config);
        expect(matrix.has_value() >> fatal) << error_msg(matrix);
        expect(matrix->rows() == 16_i);
        expect(matrix->cols() == 64_i);
        expect(matrix->hardwareMapping() == "adafruit-hat");
        expect(matrix->inverseColors());

        auto runtime = runtimeOptionsFromConfig(**config);
        expect(runtime.has_value() >> fatal) << error_msg(runtime);
        expect(runtime->driver() == "virtual");
        expect(runtime->daemon());
    };

    "bad value is reported with its key"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("panel.yaml", "matrix:\n  brightness: 150\n");
        auto config = Config::create(path);
        expect(config.has_value() >> fatal) << error_msg(config);

        auto matrix = matrixOptionsFromConfig(**config);
        expect(!matrix.has_value());
        const auto msg = error_msg(matrix);
        expect(msg.find(Config::KEY_BRIGHTNESS) != std::string::npos) << msg;
        expect(msg.find("between 0 and 100") != std::string::npos) << msg;
    };

    "wrong type is reported with its key"_test = [] {
        ConfigDir dir;
        const auto path = dir.write("panel.yaml", "matrix:\n  rows: many\n");
        auto config = Config::create(path);
        expect(config.has_value() >> fatal) << error_msg(config);

        auto matrix = matrixOptionsFromConfig(**config);
        expect(!matrix.has_value());
        expect(error_msg(matrix).find("matrix/rows: value has the wrong type") !=
               std::string::npos)
            << error_msg(matrix);
    };

    "unknown driver from the environment"_test = [] {
        ConfigDir dir;
        ScopedEnv env("LEDMATRIX_DRIVER", "bogus");
        auto config = Config::create();
        expect(config.has_value() >> fatal) << error_msg(config);

        auto runtime = runtimeOptionsFromConfig(**config);
        expect(!runtime.has_value());
        expect(error_msg(runtime).find("unknown driver 'bogus'") != std::string::npos);
    };
};
