// include/BTR/ConnectionManager.h
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "BTR/Config.hpp"
#include "BTR/Device.h"
#include "BTR/Error.h"
#include "BTR/CancellationToken.hpp"
#include "BTR/HeartbeatMonitor.hpp"
#include "BTR/IAnchorFactory.h"
#include "BTR/IConnectionPlatform.h"
#include "BTR/IDeviceDirectory.h"
#include "BTR/IPriorityBooster.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @brief Platform collaborators used by the ConnectionManager
 */
struct PlatformServices {
    std::shared_ptr<IDeviceDirectory> directory;
    std::shared_ptr<IConnectionPlatform> connections;
    std::shared_ptr<IAnchorFactory> anchors;
    std::shared_ptr<IPriorityBooster> priority;
};

enum class ConnectionPhase {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

namespace state {
    struct Disconnected {};

    struct Connecting {
        std::string identifier;
    };

    struct Connected {
        Device device;
        std::unique_ptr<IConnectionHandle> connection;
        std::unique_ptr<IAnchorStream> anchor;          ///< Null only when the anchor is disabled
        std::unique_ptr<IPriorityHandle> priority;      ///< Null when the boost was refused
    };

    struct Disconnecting {};
}

using ConnectionState = std::variant<state::Disconnected,
                                     state::Connecting,
                                     state::Connected,
                                     state::Disconnecting>;

/**
 * @brief Owns the single audio connection and everything bound to it
 *
 * Exactly one instance exists per process and it is only ever driven by the
 * CommandWorker thread, so no operation runs concurrently with another.
 * On every exit from Connected the heartbeat is cancelled first, then the
 * anchor stream is stopped and closed, the priority boost released and the
 * platform connection closed.
 */
class ConnectionManager {
public:
    ConnectionManager(PlatformServices services,
                      const Config& config,
                      std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Best-effort disconnect
     */
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open a connection to the device and start keeping it alive
     *
     * Tears down any existing connection first. On success the anchor stream
     * is running, a heartbeat monitor is active and a priority boost has
     * been attempted.
     *
     * @return IdentifierMissing, OpenFailed(status) or AnchorFailed on failure;
     *         the manager is Disconnected afterwards
     */
    std::expected<void, ConnectError> connect(const Device& device);

    /**
     * @brief disconnect() followed by connect(device); never retries
     * @return The connect failure, marked as happening during reconnect
     */
    std::expected<void, ConnectError> reconnect(const Device& device);

    /**
     * @brief Tear the connection down. Idempotent, cannot fail.
     */
    void disconnect();

    /**
     * @brief Fresh device listing from the directory
     */
    std::expected<std::vector<Device>, DirectoryError> listDevices();

    ConnectionPhase phase() const;
    bool isConnected() const { return phase() == ConnectionPhase::Connected; }

    /**
     * @brief Device of the current connection, if Connected
     */
    std::optional<Device> connectedDevice() const;

    bool hasAnchor() const;
    bool hasPriorityBoost() const;

    /**
     * @brief Heartbeat bound to the current connection, or nullptr
     */
    const HeartbeatMonitor* heartbeat() const { return monitor_.get(); }

private:
    void startHeartbeat(const std::string& identifier);
    void stopHeartbeat();

    PlatformServices services_;
    HeartbeatSettings heartbeatSettings_;
    AnchorSettings anchorSettings_;
    std::string priorityProfile_;
    std::shared_ptr<spdlog::logger> logger_;

    ConnectionState state_{state::Disconnected{}};
    std::shared_ptr<CancellationToken> heartbeatToken_;   ///< Token of the current monitor
    std::unique_ptr<HeartbeatMonitor> monitor_;
};

const char* toString(ConnectionPhase phase);

} // namespace BTR
