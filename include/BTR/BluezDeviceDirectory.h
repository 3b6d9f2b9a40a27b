// include/BTR/BluezDeviceDirectory.h
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "BTR/CommandRunner.hpp"
#include "BTR/IDeviceDirectory.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/// A2DP Audio Source service class: the remote device streams audio to us.
inline constexpr const char* kA2dpSourceUuid = "0000110a-0000-1000-8000-00805f9b34fb";

/**
 * @brief Fields of `bluetoothctl info` the backends care about
 */
struct BluezDeviceInfo {
    std::string address;
    std::string name;
    bool paired = false;
    bool connected = false;
    std::vector<std::string> uuids;

    bool isAudioSource() const;
};

/**
 * @brief Device directory backed by BlueZ through bluetoothctl
 *
 * Lists paired devices and keeps those advertising the A2DP source
 * profile, i.e. devices able to relay audio into this sink.
 */
class BluezDeviceDirectory : public IDeviceDirectory {
public:
    BluezDeviceDirectory(std::shared_ptr<ICommandRunner> runner,
                         std::string bluetoothctl = "bluetoothctl",
                         std::shared_ptr<spdlog::logger> logger = nullptr);

    std::expected<std::vector<Device>, DirectoryError> list() override;

    /**
     * @brief Parse `bluetoothctl devices` output into (name, address) devices
     */
    static std::vector<Device> parseDeviceLines(const std::string& output);

    /**
     * @brief Parse `bluetoothctl info <address>` output
     */
    static BluezDeviceInfo parseInfo(const std::string& output);

private:
    std::shared_ptr<ICommandRunner> runner_;
    std::string bluetoothctl_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace BTR
