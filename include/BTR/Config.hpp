#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <nlohmann/json_fwd.hpp>
#include "BTR/IAnchorFactory.h"

namespace BTR {

enum class ConfigError {
    Success = 0,
    ReadFailed,         // File exists but could not be read
    ParseFailed,        // Not valid JSON
    InvalidValue        // Valid JSON, value of the wrong type or out of range
};

struct HeartbeatSettings {
    std::chrono::milliseconds interval{2000};
    std::uint32_t heavyEvery = 15;      ///< Heavy keepalive on every Nth tick
};

struct AnchorSettings {
    bool enabled = true;
    double gain = 0.0001;
    AnchorQuality quality = AnchorQuality::LowestLatency;
    std::string device = "default";     ///< ALSA device name passed to aplay
};

struct Config {
    HeartbeatSettings heartbeat;
    AnchorSettings anchor;
    std::string priorityProfile = "Pro Audio";
    std::size_t commandQueueCapacity = 10;
    std::size_t eventQueueCapacity = 10;
    std::chrono::milliseconds uiPollInterval{50};
    bool scanOnStart = true;
    std::string bluetoothctlPath = "bluetoothctl";
    std::string logLevel = "info";
    std::string logFile;

    nlohmann::json toJson() const;
};

/**
 * @brief Default config path: $XDG_CONFIG_HOME/btreceiver/config.json or ~/.config/...
 */
std::filesystem::path defaultConfigPath();

/**
 * @brief Load configuration from a JSON file
 *
 * A missing file yields the defaults. Keys that are absent keep their
 * defaults; present keys must have the right type.
 */
std::expected<Config, ConfigError> loadConfig(const std::filesystem::path& path);

/**
 * @brief Parse configuration from JSON text
 */
std::expected<Config, ConfigError> parseConfig(const std::string& text);

namespace detail {
    struct ConfigErrorCategory : std::error_category {
        const char* name() const noexcept override { return "BTR.Config"; }
        std::string message(int ev) const override {
            switch (static_cast<ConfigError>(ev)) {
                case ConfigError::Success: return "Success";
                case ConfigError::ReadFailed: return "Configuration file could not be read";
                case ConfigError::ParseFailed: return "Configuration file is not valid JSON";
                case ConfigError::InvalidValue: return "Configuration value has the wrong type or range";
                default: return "Unknown configuration error";
            }
        }
    };
}

inline const std::error_category& config_error_category() noexcept {
    static detail::ConfigErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ConfigError e) noexcept {
    return {static_cast<int>(e), config_error_category()};
}

} // namespace BTR

namespace std {
    template<>
    struct is_error_code_enum<BTR::ConfigError> : true_type {};
}
