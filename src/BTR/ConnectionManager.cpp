// src/BTR/ConnectionManager.cpp

#include "BTR/ConnectionManager.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace BTR {

const char* toString(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Disconnected: return "Disconnected";
        case ConnectionPhase::Connecting: return "Connecting";
        case ConnectionPhase::Connected: return "Connected";
        case ConnectionPhase::Disconnecting: return "Disconnecting";
    }
    return "Unknown";
}

ConnectionManager::ConnectionManager(PlatformServices services,
                                     const Config& config,
                                     std::shared_ptr<spdlog::logger> logger)
    : services_(std::move(services))
    , heartbeatSettings_(config.heartbeat)
    , anchorSettings_(config.anchor)
    , priorityProfile_(config.priorityProfile)
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

std::expected<void, ConnectError> ConnectionManager::connect(const Device& device) {
    if (!std::holds_alternative<state::Disconnected>(state_)) {
        logger_->info("ConnectionManager::connect: tearing down current connection first");
        disconnect();
    }

    if (!device.hasIdentifier()) {
        logger_->error("ConnectionManager::connect: no identifier resolved for '{}'", device.displayName);
        return std::unexpected(ConnectError{ConnectErrc::IdentifierMissing});
    }

    logger_->info("Connecting to '{}' ({})...", device.displayName, device.identifier);
    state_ = state::Connecting{device.identifier};

    auto opened = services_.connections->open(device.identifier);
    if (!opened) {
        logger_->error("ConnectionManager::connect: open of {} failed: {}",
                       device.identifier, make_error_code(opened.error()).message());
        state_ = state::Disconnected{};
        return std::unexpected(ConnectError{ConnectErrc::OpenFailed, opened.error()});
    }

    state::Connected connected;
    connected.device = device;
    connected.connection = std::move(opened.value());
    logger_->info("Connection to '{}' is active", device.displayName);

    // Anchor stream keeps the audio subsystem out of its idle state.
    if (anchorSettings_.enabled) {
        auto anchor = services_.anchors->create(anchorSettings_.quality);
        if (!anchor) {
            logger_->error("ConnectionManager::connect: anchor stream failed: {}", anchor.error().message());
            connected.connection->close();
            state_ = state::Disconnected{};
            return std::unexpected(ConnectError{ConnectErrc::AnchorFailed});
        }
        connected.anchor = std::move(anchor.value());
    }

    startHeartbeat(device.identifier);

    // Best-effort: a refused boost never fails the connect.
    auto boost = services_.priority->acquire(priorityProfile_);
    if (boost) {
        connected.priority = std::move(boost.value());
        logger_->info("Priority profile '{}' acquired", priorityProfile_);
    } else {
        logger_->warn("Priority profile '{}' not acquired: {}", priorityProfile_, boost.error().message());
    }

    state_ = std::move(connected);
    return {};
}

std::expected<void, ConnectError> ConnectionManager::reconnect(const Device& device) {
    logger_->info("Reconnecting to '{}'...", device.displayName);
    disconnect();

    auto result = connect(device);
    if (!result) {
        ConnectError error = result.error();
        error.duringReconnect = true;
        return std::unexpected(error);
    }
    return {};
}

void ConnectionManager::disconnect() {
    if (std::holds_alternative<state::Disconnected>(state_)) {
        logger_->debug("ConnectionManager::disconnect: already disconnected");
        return;
    }

    ConnectionState previous = std::exchange(state_, state::Disconnecting{});

    // The monitor must be gone before the link is closed: a keepalive still
    // in flight would re-open it.
    if (heartbeatToken_) {
        heartbeatToken_->cancel();
    }
    stopHeartbeat();

    if (auto* connected = std::get_if<state::Connected>(&previous)) {
        if (connected->anchor) {
            connected->anchor->stop();
            connected->anchor->close();
            connected->anchor.reset();
        }
        if (connected->priority) {
            connected->priority->release();
            connected->priority.reset();
        }
        if (connected->connection) {
            connected->connection->close();
            connected->connection.reset();
        }
        logger_->info("Disconnected from '{}'", connected->device.displayName);
    }

    state_ = state::Disconnected{};
}

std::expected<std::vector<Device>, DirectoryError> ConnectionManager::listDevices() {
    auto devices = services_.directory->list();
    if (!devices) {
        logger_->warn("ConnectionManager::listDevices: {}", make_error_code(devices.error()).message());
        return std::unexpected(devices.error());
    }
    logger_->debug("ConnectionManager::listDevices: {} device(s)", devices->size());
    return devices;
}

ConnectionPhase ConnectionManager::phase() const {
    return std::visit([](const auto& s) -> ConnectionPhase {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, state::Disconnected>) {
            return ConnectionPhase::Disconnected;
        } else if constexpr (std::is_same_v<S, state::Connecting>) {
            return ConnectionPhase::Connecting;
        } else if constexpr (std::is_same_v<S, state::Connected>) {
            return ConnectionPhase::Connected;
        } else {
            return ConnectionPhase::Disconnecting;
        }
    }, state_);
}

std::optional<Device> ConnectionManager::connectedDevice() const {
    if (auto* connected = std::get_if<state::Connected>(&state_)) {
        return connected->device;
    }
    return std::nullopt;
}

bool ConnectionManager::hasAnchor() const {
    auto* connected = std::get_if<state::Connected>(&state_);
    return connected && connected->anchor != nullptr;
}

bool ConnectionManager::hasPriorityBoost() const {
    auto* connected = std::get_if<state::Connected>(&state_);
    return connected && connected->priority != nullptr;
}

void ConnectionManager::startHeartbeat(const std::string& identifier) {
    // Invalidate the predecessor before issuing a new token.
    if (heartbeatToken_) {
        heartbeatToken_->cancel();
    }
    stopHeartbeat();

    heartbeatToken_ = CancellationToken::create();
    monitor_ = std::make_unique<HeartbeatMonitor>(identifier,
                                                  *services_.connections,
                                                  heartbeatToken_,
                                                  heartbeatSettings_,
                                                  logger_);
    if (!monitor_->start()) {
        logger_->error("ConnectionManager: heartbeat for {} could not be started", identifier);
    }
}

void ConnectionManager::stopHeartbeat() {
    // Destroying the monitor joins its thread; the token is already cancelled.
    monitor_.reset();
    heartbeatToken_.reset();
}

} // namespace BTR
