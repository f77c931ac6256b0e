#pragma once

#include <ledmatrix/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ledmatrix {

/**
 * Config - layered YAML configuration.
 *
 * Layers, lowest priority first:
 *   1. built-in defaults (same values as MatrixOptions/RuntimeOptions)
 *   2. the YAML file (explicit path, else $XDG_CONFIG_HOME/ledmatrix/config.yaml)
 *   3. LEDMATRIX_* environment variables ("matrix/chain-length" is
 *      LEDMATRIX_MATRIX_CHAIN_LENGTH)
 *   4. command line overrides
 *
 * Keys are slash separated paths, e.g. "matrix/rows".
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key is missing or does not convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "LEDMATRIX_";

    static constexpr const char* KEY_DRIVER = "driver";
    static constexpr const char* KEY_HARDWARE_MAPPING = "matrix/hardware-mapping";
    static constexpr const char* KEY_ROWS = "matrix/rows";
    static constexpr const char* KEY_COLS = "matrix/cols";
    static constexpr const char* KEY_CHAIN_LENGTH = "matrix/chain-length";
    static constexpr const char* KEY_PARALLEL = "matrix/parallel";
    static constexpr const char* KEY_PWM_BITS = "matrix/pwm-bits";
    static constexpr const char* KEY_PWM_LSB_NANOSECONDS = "matrix/pwm-lsb-nanoseconds";
    static constexpr const char* KEY_PWM_DITHER_BITS = "matrix/pwm-dither-bits";
    static constexpr const char* KEY_BRIGHTNESS = "matrix/brightness";
    static constexpr const char* KEY_SCAN_MODE = "matrix/scan-mode";
    static constexpr const char* KEY_ROW_ADDRESS_TYPE = "matrix/row-address-type";
    static constexpr const char* KEY_MULTIPLEXING = "matrix/multiplexing";
    static constexpr const char* KEY_LED_RGB_SEQUENCE = "matrix/led-rgb-sequence";
    static constexpr const char* KEY_PIXEL_MAPPER = "matrix/pixel-mapper";
    static constexpr const char* KEY_PANEL_TYPE = "matrix/panel-type";
    static constexpr const char* KEY_HARDWARE_PULSING = "matrix/hardware-pulsing";
    static constexpr const char* KEY_SHOW_REFRESH_RATE = "matrix/show-refresh-rate";
    static constexpr const char* KEY_INVERSE_COLORS = "matrix/inverse-colors";
    static constexpr const char* KEY_LIMIT_REFRESH_RATE_HZ = "matrix/limit-refresh-rate-hz";
    static constexpr const char* KEY_GPIO_SLOWDOWN = "runtime/gpio-slowdown";
    static constexpr const char* KEY_DAEMON = "runtime/daemon";
    static constexpr const char* KEY_DROP_PRIVILEGES = "runtime/drop-privileges";
    static constexpr const char* KEY_GPIO_INIT = "runtime/gpio-init";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(const YAML::Node& node, const std::string& prefix);
    void setScalar(const std::string& path, const std::string& value);

    YAML::Node getNode(const std::string& path) const;

    // "matrix/chain-length" -> "LEDMATRIX_MATRIX_CHAIN_LENGTH"
    static std::string pathToEnvVar(const std::string& path);

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace ledmatrix
