#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "BTR/Device.h"

namespace BTR {

/**
 * @brief Connect to a device by display name
 *
 * identifier is the one the UI saw in its last DeviceList; when set, the
 * worker resolves by identifier instead of re-matching the name.
 */
struct ConnectCommand {
    std::string displayName;
    std::optional<std::string> identifier;
};

struct ReconnectCommand {
    std::string displayName;
    std::optional<std::string> identifier;
};

struct DisconnectCommand {};

struct ScanCommand {};

using Command = std::variant<ConnectCommand, ReconnectCommand, DisconnectCommand, ScanCommand>;

struct DeviceListEvent {
    std::vector<Device> devices;
};

/**
 * @brief Current connection; std::nullopt means disconnected
 */
struct ConnectionStatusEvent {
    std::optional<std::string> displayName;
};

const char* commandName(const Command& command);

} // namespace BTR
