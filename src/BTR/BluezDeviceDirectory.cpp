#include "BTR/BluezDeviceDirectory.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace BTR {

namespace {

constexpr std::size_t kAddressLength = 17; // AA:BB:CC:DD:EE:FF

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool BluezDeviceInfo::isAudioSource() const {
    return std::any_of(uuids.begin(), uuids.end(), [](const std::string& uuid) {
        return toLower(uuid) == kA2dpSourceUuid;
    });
}

BluezDeviceDirectory::BluezDeviceDirectory(std::shared_ptr<ICommandRunner> runner,
                                           std::string bluetoothctl,
                                           std::shared_ptr<spdlog::logger> logger)
    : runner_(std::move(runner))
    , bluetoothctl_(std::move(bluetoothctl))
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

std::vector<Device> BluezDeviceDirectory::parseDeviceLines(const std::string& output) {
    std::vector<Device> devices;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!startsWith(line, "Device ")) {
            continue;
        }
        std::string rest = line.substr(7);
        if (rest.size() < kAddressLength) {
            continue;
        }
        Device device;
        device.identifier = rest.substr(0, kAddressLength);
        device.displayName = trim(rest.substr(kAddressLength));
        if (device.displayName.empty()) {
            device.displayName = device.identifier;
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

BluezDeviceInfo BluezDeviceDirectory::parseInfo(const std::string& output) {
    BluezDeviceInfo info;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (startsWith(line, "Device ") && line.size() >= 7 + kAddressLength) {
            info.address = line.substr(7, kAddressLength);
        } else if (startsWith(line, "Name:")) {
            info.name = trim(line.substr(5));
        } else if (startsWith(line, "Paired:")) {
            info.paired = trim(line.substr(7)) == "yes";
        } else if (startsWith(line, "Connected:")) {
            info.connected = trim(line.substr(10)) == "yes";
        } else if (startsWith(line, "UUID:")) {
            // "UUID: Audio Source   (0000110a-0000-1000-8000-00805f9b34fb)"
            auto open = line.rfind('(');
            auto close = line.rfind(')');
            if (open != std::string::npos && close != std::string::npos && close > open) {
                info.uuids.push_back(line.substr(open + 1, close - open - 1));
            }
        }
    }
    return info;
}

std::expected<std::vector<Device>, DirectoryError> BluezDeviceDirectory::list() {
    auto paired = runner_->run({bluetoothctl_, "devices", "Paired"});
    if (!paired || paired->exitCode != 0) {
        logger_->error("BluezDeviceDirectory: listing paired devices failed");
        return std::unexpected(DirectoryError::DirectoryUnavailable);
    }

    std::vector<Device> result;
    for (auto& device : parseDeviceLines(paired->output)) {
        auto info = runner_->run({bluetoothctl_, "info", device.identifier});
        if (!info || info->exitCode != 0) {
            logger_->error("BluezDeviceDirectory: info for {} failed", device.identifier);
            return std::unexpected(DirectoryError::DirectoryUnavailable);
        }
        auto parsed = parseInfo(info->output);
        if (!parsed.isAudioSource()) {
            logger_->trace("BluezDeviceDirectory: skipping {} (no A2DP source)", device.identifier);
            continue;
        }
        result.push_back(std::move(device));
    }

    logger_->debug("BluezDeviceDirectory: {} audio source device(s)", result.size());
    return result;
}

} // namespace BTR
