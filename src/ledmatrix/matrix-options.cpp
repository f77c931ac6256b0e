#include <ledmatrix/matrix-options.h>
#include <ledmatrix/config.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <type_traits>

namespace ledmatrix {

// Hardware mappings known to the rgb-matrix driver
static constexpr std::array<std::string_view, 7> HARDWARE_MAPPINGS = {
    "regular", "regular-pi1", "adafruit-hat", "adafruit-hat-pwm",
    "classic", "classic-pi1", "compute-module",
};

//=============================================================================
// MatrixOptions
//=============================================================================

Result<void> MatrixOptions::setHardwareMapping(const std::string& name) {
    if (std::find(HARDWARE_MAPPINGS.begin(), HARDWARE_MAPPINGS.end(), name) ==
        HARDWARE_MAPPINGS.end()) {
        return Err<void>("unsupported hardware mapping '" + name + "'");
    }
    _hardwareMapping = name;
    return Ok();
}

Result<void> MatrixOptions::setRows(int rows) {
    if (rows < 8 || rows > 64 || rows % 2 != 0) {
        return Err<void>("rows must be an even number between 8 and 64, got " +
                         std::to_string(rows));
    }
    _rows = rows;
    return Ok();
}

Result<void> MatrixOptions::setCols(int cols) {
    if (cols <= 0) {
        return Err<void>("cols must be positive, got " + std::to_string(cols));
    }
    _cols = cols;
    return Ok();
}

Result<void> MatrixOptions::setChainLength(int chainLength) {
    if (chainLength <= 0) {
        return Err<void>("chain length must be positive, got " + std::to_string(chainLength));
    }
    _chainLength = chainLength;
    return Ok();
}

Result<void> MatrixOptions::setParallel(int parallel) {
    if (parallel < 1 || parallel > 6) {
        return Err<void>("parallel chains must be between 1 and 6, got " +
                         std::to_string(parallel));
    }
    _parallel = parallel;
    return Ok();
}

Result<void> MatrixOptions::setPwmBits(int bits) {
    if (bits < 1 || bits > 11) {
        return Err<void>("pwm bits must be between 1 and 11, got " + std::to_string(bits));
    }
    _pwmBits = bits;
    return Ok();
}

Result<void> MatrixOptions::setPwmLsbNanoseconds(int nanoseconds) {
    if (nanoseconds <= 0) {
        return Err<void>("pwm lsb nanoseconds must be positive, got " +
                         std::to_string(nanoseconds));
    }
    _pwmLsbNanoseconds = nanoseconds;
    return Ok();
}

Result<void> MatrixOptions::setPwmDitherBits(int bits) {
    if (bits < 0 || bits > 2) {
        return Err<void>("pwm dither bits must be between 0 and 2, got " + std::to_string(bits));
    }
    _pwmDitherBits = bits;
    return Ok();
}

Result<void> MatrixOptions::setBrightness(int percent) {
    if (percent < 0 || percent > 100) {
        return Err<void>("brightness must be between 0 and 100, got " + std::to_string(percent));
    }
    _brightness = percent;
    return Ok();
}

Result<void> MatrixOptions::setScanMode(int mode) {
    if (mode != 0 && mode != 1) {
        return Err<void>("scan mode must be 0 (progressive) or 1 (interlaced), got " +
                         std::to_string(mode));
    }
    _scanMode = mode;
    return Ok();
}

Result<void> MatrixOptions::setRowAddressType(int type) {
    if (type < 0 || type > 5) {
        return Err<void>("row address type must be between 0 and 5, got " + std::to_string(type));
    }
    _rowAddressType = type;
    return Ok();
}

Result<void> MatrixOptions::setMultiplexing(int multiplexing) {
    if (multiplexing < 0) {
        return Err<void>("multiplexing must not be negative, got " + std::to_string(multiplexing));
    }
    _multiplexing = multiplexing;
    return Ok();
}

Result<void> MatrixOptions::setLedRgbSequence(const std::string& sequence) {
    std::string sorted = sequence;
    std::transform(sorted.begin(), sorted.end(), sorted.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::string upper = sorted;
    std::sort(sorted.begin(), sorted.end());
    if (sorted != "BGR") {
        return Err<void>("led rgb sequence must be a permutation of RGB, got '" + sequence + "'");
    }
    _ledRgbSequence = upper;
    return Ok();
}

Result<void> MatrixOptions::setLimitRefreshRateHz(int hz) {
    if (hz < 0) {
        return Err<void>("refresh rate limit must not be negative, got " + std::to_string(hz));
    }
    _limitRefreshRateHz = hz;
    return Ok();
}

//=============================================================================
// RuntimeOptions
//=============================================================================

const char* RuntimeOptions::defaultDriver() {
#ifdef LEDMATRIX_HAS_RGB_MATRIX
    return DRIVER_RGB_MATRIX;
#else
    return DRIVER_VIRTUAL;
#endif
}

Result<void> RuntimeOptions::setGpioSlowdown(int slowdown) {
    if (slowdown < 0) {
        return Err<void>("gpio slowdown must not be negative, got " + std::to_string(slowdown));
    }
    _gpioSlowdown = slowdown;
    return Ok();
}

Result<void> RuntimeOptions::setDriver(const std::string& name) {
    if (name == DRIVER_VIRTUAL) {
        _driver = name;
        return Ok();
    }
    if (name == DRIVER_RGB_MATRIX) {
#ifdef LEDMATRIX_HAS_RGB_MATRIX
        _driver = name;
        return Ok();
#else
        return Err<void>("driver 'rgb-matrix' is not available in this build");
#endif
    }
    return Err<void>("unknown driver '" + name + "'");
}

//=============================================================================
// Config -> options
//=============================================================================

namespace {

// Reads one key and feeds it through a validating setter
template<typename T, typename Setter>
Result<void> applyKey(const Config& config, const char* key, Setter&& setter) {
    if (!config.has(key)) {
        return Ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return Err<void>(std::string(key) + ": value has the wrong type");
    }
    if constexpr (std::is_void_v<decltype(setter(*value))>) {
        setter(*value);
        return Ok();
    } else {
        if (auto res = setter(*value); !res) {
            return Err<void>(key, res);
        }
        return Ok();
    }
}

} // namespace

Result<MatrixOptions> matrixOptionsFromConfig(const Config& config) {
    MatrixOptions o;
    Result<void> res = Ok();

    auto check = [&](Result<void> r) {
        if (res && !r) res = std::move(r);
    };

    check(applyKey<std::string>(config, Config::KEY_HARDWARE_MAPPING,
                                [&](const std::string& v) { return o.setHardwareMapping(v); }));
    check(applyKey<int>(config, Config::KEY_ROWS, [&](int v) { return o.setRows(v); }));
    check(applyKey<int>(config, Config::KEY_COLS, [&](int v) { return o.setCols(v); }));
    check(applyKey<int>(config, Config::KEY_CHAIN_LENGTH,
                        [&](int v) { return o.setChainLength(v); }));
    check(applyKey<int>(config, Config::KEY_PARALLEL, [&](int v) { return o.setParallel(v); }));
    check(applyKey<int>(config, Config::KEY_PWM_BITS, [&](int v) { return o.setPwmBits(v); }));
    check(applyKey<int>(config, Config::KEY_PWM_LSB_NANOSECONDS,
                        [&](int v) { return o.setPwmLsbNanoseconds(v); }));
    check(applyKey<int>(config, Config::KEY_PWM_DITHER_BITS,
                        [&](int v) { return o.setPwmDitherBits(v); }));
    check(applyKey<int>(config, Config::KEY_BRIGHTNESS,
                        [&](int v) { return o.setBrightness(v); }));
    check(applyKey<int>(config, Config::KEY_SCAN_MODE, [&](int v) { return o.setScanMode(v); }));
    check(applyKey<int>(config, Config::KEY_ROW_ADDRESS_TYPE,
                        [&](int v) { return o.setRowAddressType(v); }));
    check(applyKey<int>(config, Config::KEY_MULTIPLEXING,
                        [&](int v) { return o.setMultiplexing(v); }));
    check(applyKey<std::string>(config, Config::KEY_LED_RGB_SEQUENCE,
                                [&](const std::string& v) { return o.setLedRgbSequence(v); }));
    check(applyKey<std::string>(config, Config::KEY_PIXEL_MAPPER,
                                [&](const std::string& v) { o.setPixelMapperConfig(v); }));
    check(applyKey<std::string>(config, Config::KEY_PANEL_TYPE,
                                [&](const std::string& v) { o.setPanelType(v); }));
    check(applyKey<bool>(config, Config::KEY_HARDWARE_PULSING,
                         [&](bool v) { o.setHardwarePulsing(v); }));
    check(applyKey<bool>(config, Config::KEY_SHOW_REFRESH_RATE,
                         [&](bool v) { o.setShowRefreshRate(v); }));
    check(applyKey<bool>(config, Config::KEY_INVERSE_COLORS,
                         [&](bool v) { o.setInverseColors(v); }));
    check(applyKey<int>(config, Config::KEY_LIMIT_REFRESH_RATE_HZ,
                        [&](int v) { return o.setLimitRefreshRateHz(v); }));

    if (!res) {
        return Err<MatrixOptions>("invalid matrix configuration", res);
    }
    return Ok(std::move(o));
}

Result<RuntimeOptions> runtimeOptionsFromConfig(const Config& config) {
    RuntimeOptions o;
    Result<void> res = Ok();

    auto check = [&](Result<void> r) {
        if (res && !r) res = std::move(r);
    };

    check(applyKey<std::string>(config, Config::KEY_DRIVER,
                                [&](const std::string& v) { return o.setDriver(v); }));
    check(applyKey<int>(config, Config::KEY_GPIO_SLOWDOWN,
                        [&](int v) { return o.setGpioSlowdown(v); }));
    check(applyKey<bool>(config, Config::KEY_DAEMON, [&](bool v) { o.setDaemon(v); }));
    check(applyKey<bool>(config, Config::KEY_DROP_PRIVILEGES,
                         [&](bool v) { o.setDropPrivileges(v); }));
    check(applyKey<bool>(config, Config::KEY_GPIO_INIT, [&](bool v) { o.setDoGpioInit(v); }));

    if (!res) {
        return Err<RuntimeOptions>("invalid runtime configuration", res);
    }
    return Ok(std::move(o));
}

} // namespace ledmatrix
