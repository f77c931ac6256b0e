#pragma once

#include <ledmatrix/result.hpp>
#include <cstdint>
#include <string>

namespace ledmatrix {

class Config;

/**
 * MatrixOptions - panel geometry and hardware configuration of a session.
 *
 * Every setter that can receive an invalid value returns Result<void> and
 * names the violated constraint. Values are never clamped; a rejected call
 * leaves the previous value in place.
 */
class MatrixOptions {
public:
    MatrixOptions() = default;

    Result<void> setHardwareMapping(const std::string& name);
    Result<void> setRows(int rows);
    Result<void> setCols(int cols);
    Result<void> setChainLength(int chainLength);
    Result<void> setParallel(int parallel);
    Result<void> setPwmBits(int bits);
    Result<void> setPwmLsbNanoseconds(int nanoseconds);
    Result<void> setPwmDitherBits(int bits);
    Result<void> setBrightness(int percent);
    Result<void> setScanMode(int mode);
    Result<void> setRowAddressType(int type);
    Result<void> setMultiplexing(int multiplexing);
    Result<void> setLedRgbSequence(const std::string& sequence);
    Result<void> setLimitRefreshRateHz(int hz);

    void setPixelMapperConfig(const std::string& config) { _pixelMapperConfig = config; }
    void setPanelType(const std::string& type) { _panelType = type; }
    void setHardwarePulsing(bool enable) { _hardwarePulsing = enable; }
    void setShowRefreshRate(bool enable) { _showRefreshRate = enable; }
    void setInverseColors(bool enable) { _inverseColors = enable; }

    const std::string& hardwareMapping() const { return _hardwareMapping; }
    int rows() const { return _rows; }
    int cols() const { return _cols; }
    int chainLength() const { return _chainLength; }
    int parallel() const { return _parallel; }
    int pwmBits() const { return _pwmBits; }
    int pwmLsbNanoseconds() const { return _pwmLsbNanoseconds; }
    int pwmDitherBits() const { return _pwmDitherBits; }
    int brightness() const { return _brightness; }
    int scanMode() const { return _scanMode; }
    int rowAddressType() const { return _rowAddressType; }
    int multiplexing() const { return _multiplexing; }
    const std::string& ledRgbSequence() const { return _ledRgbSequence; }
    const std::string& pixelMapperConfig() const { return _pixelMapperConfig; }
    const std::string& panelType() const { return _panelType; }
    bool hardwarePulsing() const { return _hardwarePulsing; }
    bool showRefreshRate() const { return _showRefreshRate; }
    bool inverseColors() const { return _inverseColors; }
    int limitRefreshRateHz() const { return _limitRefreshRateHz; }

    // Canvas geometry: chained panels extend the width, parallel chains the height
    int width() const { return _cols * _chainLength; }
    int height() const { return _rows * _parallel; }

private:
    std::string _hardwareMapping = "regular";
    int _rows = 32;
    int _cols = 32;
    int _chainLength = 1;
    int _parallel = 1;
    int _pwmBits = 11;
    int _pwmLsbNanoseconds = 130;
    int _pwmDitherBits = 0;
    int _brightness = 100;
    int _scanMode = 0;
    int _rowAddressType = 0;
    int _multiplexing = 0;
    std::string _ledRgbSequence = "RGB";
    std::string _pixelMapperConfig;
    std::string _panelType;
    bool _hardwarePulsing = true;
    bool _showRefreshRate = false;
    bool _inverseColors = false;
    int _limitRefreshRateHz = 0;
};

/**
 * RuntimeOptions - process-level settings of a session and the driver
 * backend that runs it.
 */
class RuntimeOptions {
public:
    RuntimeOptions() = default;

    static constexpr const char* DRIVER_RGB_MATRIX = "rgb-matrix";
    static constexpr const char* DRIVER_VIRTUAL = "virtual";

    // Backend used when none is configured
    static const char* defaultDriver();

    Result<void> setGpioSlowdown(int slowdown);
    Result<void> setDriver(const std::string& name);
    void setDaemon(bool enable) { _daemon = enable; }
    void setDropPrivileges(bool enable) { _dropPrivileges = enable; }
    void setDoGpioInit(bool enable) { _doGpioInit = enable; }

    int gpioSlowdown() const { return _gpioSlowdown; }
    const std::string& driver() const { return _driver; }
    bool daemon() const { return _daemon; }
    bool dropPrivileges() const { return _dropPrivileges; }
    bool doGpioInit() const { return _doGpioInit; }

private:
    int _gpioSlowdown = 1;
    std::string _driver = defaultDriver();
    bool _daemon = false;
    bool _dropPrivileges = true;
    bool _doGpioInit = true;
};

// Build options from the matrix/ and runtime/ sections of a Config.
// A bad value is reported together with its key.
Result<MatrixOptions> matrixOptionsFromConfig(const Config& config);
Result<RuntimeOptions> runtimeOptionsFromConfig(const Config& config);

} // namespace ledmatrix
