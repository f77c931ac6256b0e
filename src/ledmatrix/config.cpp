#include "ledmatrix/config.h"
#include "ledmatrix/matrix-options.h"
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace ledmatrix {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// ─── Config ──────────────────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {
    loadDefaults();
}

Result<void> Config::init() noexcept {
    if (!_configPath.empty()) {
        // An explicitly requested file must load
        if (auto res = loadFile(_configPath); !res) {
            return Err<void>("Failed to load config file " + _configPath, res);
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        if (std::filesystem::exists(xdgPath)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides(YAML::Clone(_config), "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }

    return Ok();
}

void Config::loadDefaults() {
    MatrixOptions matrix;
    RuntimeOptions runtime;

    _config["driver"] = runtime.driver();

    YAML::Node m(YAML::NodeType::Map);
    m["hardware-mapping"] = matrix.hardwareMapping();
    m["rows"] = matrix.rows();
    m["cols"] = matrix.cols();
    m["chain-length"] = matrix.chainLength();
    m["parallel"] = matrix.parallel();
    m["pwm-bits"] = matrix.pwmBits();
    m["pwm-lsb-nanoseconds"] = matrix.pwmLsbNanoseconds();
    m["pwm-dither-bits"] = matrix.pwmDitherBits();
    m["brightness"] = matrix.brightness();
    m["scan-mode"] = matrix.scanMode();
    m["row-address-type"] = matrix.rowAddressType();
    m["multiplexing"] = matrix.multiplexing();
    m["led-rgb-sequence"] = matrix.ledRgbSequence();
    m["pixel-mapper"] = matrix.pixelMapperConfig();
    m["panel-type"] = matrix.panelType();
    m["hardware-pulsing"] = matrix.hardwarePulsing();
    m["show-refresh-rate"] = matrix.showRefreshRate();
    m["inverse-colors"] = matrix.inverseColors();
    m["limit-refresh-rate-hz"] = matrix.limitRefreshRateHz();
    _config["matrix"] = m;

    YAML::Node r(YAML::NodeType::Map);
    r["gpio-slowdown"] = runtime.gpioSlowdown();
    r["daemon"] = runtime.daemon();
    r["drop-privileges"] = runtime.dropPrivileges();
    r["gpio-init"] = runtime.doGpioInit();
    _config["runtime"] = r;
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config file is not a YAML map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

// Every known leaf can be overridden from the environment. The walk runs over
// a snapshot so overrides never feed back into the traversal.
void Config::applyEnvOverrides(const YAML::Node& node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            setScalar(fullPath, val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::setScalar(const std::string& path, const std::string& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;

    YAML::Node current;
    current.reset(_config);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            next = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(next);
    }
    current[parts.back()] = value;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next.IsDefined()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(next);
    }
    return current;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "ledmatrix" / "config.yaml";
}

} // namespace ledmatrix
