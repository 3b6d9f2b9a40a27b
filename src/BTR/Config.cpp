// src/BTR/Config.cpp

#include "BTR/Config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace BTR {

using json = nlohmann::json;

namespace {

std::string qualityToString(AnchorQuality quality) {
    switch (quality) {
        case AnchorQuality::LowestLatency: return "lowest_latency";
        case AnchorQuality::Default: return "default";
    }
    return "default";
}

// Copies obj[key] into out when present. Throws json::type_error on a type mismatch.
template<typename T>
void readIfPresent(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end()) {
        out = it->get<T>();
    }
}

std::expected<void, ConfigError> applyJson(const json& root, Config& config) {
    if (!root.is_object()) {
        return std::unexpected(ConfigError::InvalidValue);
    }

    if (auto it = root.find("heartbeat"); it != root.end()) {
        std::int64_t intervalMs = config.heartbeat.interval.count();
        readIfPresent(*it, "interval_ms", intervalMs);
        readIfPresent(*it, "heavy_every", config.heartbeat.heavyEvery);
        if (intervalMs <= 0 || config.heartbeat.heavyEvery == 0) {
            spdlog::error("Config: heartbeat.interval_ms and heartbeat.heavy_every must be positive");
            return std::unexpected(ConfigError::InvalidValue);
        }
        config.heartbeat.interval = std::chrono::milliseconds(intervalMs);
    }

    if (auto it = root.find("anchor"); it != root.end()) {
        readIfPresent(*it, "enabled", config.anchor.enabled);
        readIfPresent(*it, "gain", config.anchor.gain);
        readIfPresent(*it, "device", config.anchor.device);
        std::string quality = qualityToString(config.anchor.quality);
        readIfPresent(*it, "quality", quality);
        if (quality == "lowest_latency") {
            config.anchor.quality = AnchorQuality::LowestLatency;
        } else if (quality == "default") {
            config.anchor.quality = AnchorQuality::Default;
        } else {
            spdlog::error("Config: unknown anchor.quality '{}'", quality);
            return std::unexpected(ConfigError::InvalidValue);
        }
        if (config.anchor.gain < 0.0 || config.anchor.gain > 1.0) {
            spdlog::error("Config: anchor.gain {} outside [0, 1]", config.anchor.gain);
            return std::unexpected(ConfigError::InvalidValue);
        }
    }

    if (auto it = root.find("priority"); it != root.end()) {
        readIfPresent(*it, "profile", config.priorityProfile);
    }

    if (auto it = root.find("queues"); it != root.end()) {
        readIfPresent(*it, "command_capacity", config.commandQueueCapacity);
        readIfPresent(*it, "event_capacity", config.eventQueueCapacity);
        if (config.commandQueueCapacity == 0 || config.eventQueueCapacity == 0) {
            spdlog::error("Config: queue capacities must be positive");
            return std::unexpected(ConfigError::InvalidValue);
        }
    }

    if (auto it = root.find("ui"); it != root.end()) {
        std::int64_t pollMs = config.uiPollInterval.count();
        readIfPresent(*it, "poll_interval_ms", pollMs);
        if (pollMs <= 0) {
            spdlog::error("Config: ui.poll_interval_ms must be positive");
            return std::unexpected(ConfigError::InvalidValue);
        }
        config.uiPollInterval = std::chrono::milliseconds(pollMs);
    }

    if (auto it = root.find("log"); it != root.end()) {
        readIfPresent(*it, "level", config.logLevel);
        readIfPresent(*it, "file", config.logFile);
    }

    readIfPresent(root, "scan_on_start", config.scanOnStart);
    readIfPresent(root, "bluetoothctl", config.bluetoothctlPath);
    return {};
}

} // namespace

json Config::toJson() const {
    return json{
        {"heartbeat", {
            {"interval_ms", heartbeat.interval.count()},
            {"heavy_every", heartbeat.heavyEvery}
        }},
        {"anchor", {
            {"enabled", anchor.enabled},
            {"gain", anchor.gain},
            {"quality", qualityToString(anchor.quality)},
            {"device", anchor.device}
        }},
        {"priority", {{"profile", priorityProfile}}},
        {"queues", {
            {"command_capacity", commandQueueCapacity},
            {"event_capacity", eventQueueCapacity}
        }},
        {"ui", {{"poll_interval_ms", uiPollInterval.count()}}},
        {"scan_on_start", scanOnStart},
        {"bluetoothctl", bluetoothctlPath},
        {"log", {{"level", logLevel}, {"file", logFile}}}
    };
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".";
    }
    return base / "btreceiver" / "config.json";
}

std::expected<Config, ConfigError> parseConfig(const std::string& text) {
    Config config;
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::error("Config: parse error: {}", e.what());
        return std::unexpected(ConfigError::ParseFailed);
    }

    try {
        auto applied = applyJson(root, config);
        if (!applied) {
            return std::unexpected(applied.error());
        }
    } catch (const json::exception& e) {
        spdlog::error("Config: invalid value: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }
    return config;
}

std::expected<Config, ConfigError> loadConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::info("Config: {} not found, using defaults", path.string());
        return Config{};
    }

    std::ifstream file(path);
    if (!file) {
        spdlog::error("Config: cannot open {}", path.string());
        return std::unexpected(ConfigError::ReadFailed);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        spdlog::error("Config: read error on {}", path.string());
        return std::unexpected(ConfigError::ReadFailed);
    }
    spdlog::info("Config: loading {}", path.string());
    return parseConfig(buffer.str());
}

} // namespace BTR
