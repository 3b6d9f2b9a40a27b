// src/BTR/CommandWorker.cpp

#include "BTR/CommandWorker.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace BTR {

const char* commandName(const Command& command) {
    return std::visit([](const auto& c) -> const char* {
        using C = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<C, ConnectCommand>) {
            return "Connect";
        } else if constexpr (std::is_same_v<C, ReconnectCommand>) {
            return "Reconnect";
        } else if constexpr (std::is_same_v<C, DisconnectCommand>) {
            return "Disconnect";
        } else {
            return "Scan";
        }
    }, command);
}

CommandWorker::CommandWorker(std::unique_ptr<ConnectionManager> manager,
                             std::shared_ptr<WorkerChannels> channels,
                             bool scanOnStart,
                             std::shared_ptr<spdlog::logger> logger)
    : manager_(std::move(manager))
    , channels_(std::move(channels))
    , scanOnStart_(scanOnStart)
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

CommandWorker::~CommandWorker() {
    stop();
}

bool CommandWorker::start() {
    if (running_.load() || thread_.joinable()) {
        logger_->warn("CommandWorker::start: already running");
        return false;
    }
    if (!manager_ || !channels_) {
        logger_->error("CommandWorker::start: manager or channels missing");
        return false;
    }

    try {
        running_.store(true);
        thread_ = std::thread(&CommandWorker::run, this);
    } catch (const std::system_error& e) {
        running_.store(false);
        logger_->error("CommandWorker::start: failed to start thread: {}", e.what());
        return false;
    }
    logger_->info("CommandWorker started");
    return true;
}

void CommandWorker::stop() {
    if (!thread_.joinable()) {
        return;
    }

    // Closing the event queues too keeps a publish from blocking forever
    // once nobody drains them; queued events stay readable.
    channels_->commands.close();
    channels_->deviceLists.close();
    channels_->statuses.close();
    thread_.join();
    logger_->info("CommandWorker stopped after {} command(s)", processed_.load());
}

bool CommandWorker::submit(Command command) {
    const char* name = commandName(command);
    if (!channels_->commands.tryPush(std::move(command))) {
        logger_->warn("CommandWorker::submit: command queue full or closed, dropping {}", name);
        return false;
    }
    logger_->trace("CommandWorker::submit: queued {}", name);
    return true;
}

void CommandWorker::run() {
    if (scanOnStart_) {
        handleScan();
    }

    while (auto command = channels_->commands.pop()) {
        // After stop() only the final disconnect may touch the link.
        if (channels_->commands.isClosed() &&
            (std::holds_alternative<ConnectCommand>(*command) ||
             std::holds_alternative<ReconnectCommand>(*command))) {
            logger_->info("CommandWorker: shutting down, skipping {}", commandName(*command));
        } else {
            logger_->debug("CommandWorker: processing {}", commandName(*command));
            dispatch(*command);
        }
        processed_.fetch_add(1);
    }

    // The priority boost belongs to this thread, so release it here.
    manager_->disconnect();
    running_.store(false);
    logger_->debug("CommandWorker: command queue closed, exiting");
}

void CommandWorker::dispatch(const Command& command) {
    std::visit([this](const auto& c) {
        using C = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<C, ConnectCommand>) {
            handleConnect(c);
        } else if constexpr (std::is_same_v<C, ReconnectCommand>) {
            handleReconnect(c);
        } else if constexpr (std::is_same_v<C, DisconnectCommand>) {
            handleDisconnect();
        } else {
            handleScan();
        }
    }, command);
}

void CommandWorker::handleScan() {
    auto devices = manager_->listDevices();
    if (!devices) {
        logger_->warn("Scan failed: {}; the list can be refreshed later",
                      make_error_code(devices.error()).message());
        return;
    }
    publishDevices(std::move(devices.value()));
}

void CommandWorker::handleConnect(const ConnectCommand& command) {
    auto target = resolve(command.displayName, command.identifier);
    if (!target) {
        return;
    }

    const bool wasConnected = manager_->isConnected();
    auto result = manager_->connect(*target);
    if (result) {
        publishStatus(target->displayName);
        return;
    }

    logger_->error("Connect to '{}' failed: {}", target->displayName, result.error().message());
    // connect() tore the previous connection down before failing.
    if (wasConnected) {
        publishStatus(std::nullopt);
    }
}

void CommandWorker::handleReconnect(const ReconnectCommand& command) {
    auto target = resolve(command.displayName, command.identifier);
    if (!target) {
        return;
    }

    auto result = manager_->reconnect(*target);
    if (result) {
        publishStatus(target->displayName);
        return;
    }

    logger_->error("Reconnect to '{}' failed: {}", target->displayName, result.error().message());
    publishStatus(std::nullopt);
}

void CommandWorker::handleDisconnect() {
    manager_->disconnect();
    publishStatus(std::nullopt);
}

std::optional<Device> CommandWorker::resolve(const std::string& displayName,
                                             const std::optional<std::string>& identifier) {
    auto devices = manager_->listDevices();
    if (!devices) {
        logger_->error("Cannot resolve '{}': {}", displayName, make_error_code(devices.error()).message());
        return std::nullopt;
    }

    auto matches = [&](const Device& device) {
        return identifier ? device.identifier == *identifier : device.displayName == displayName;
    };
    auto it = std::find_if(devices->begin(), devices->end(), matches);
    if (it == devices->end()) {
        logger_->warn("'{}': {}", displayName, make_error_code(ConnectErrc::DeviceNotFound).message());
        return std::nullopt;
    }
    return *it;
}

void CommandWorker::publishDevices(std::vector<Device> devices) {
    logger_->trace("CommandWorker: publishing {} device(s)", devices.size());
    if (!channels_->deviceLists.push(DeviceListEvent{std::move(devices)})) {
        logger_->debug("CommandWorker: device list queue closed");
    }
}

void CommandWorker::publishStatus(std::optional<std::string> displayName) {
    logger_->trace("CommandWorker: publishing status {}", displayName.value_or("<none>"));
    if (!channels_->statuses.push(ConnectionStatusEvent{std::move(displayName)})) {
        logger_->debug("CommandWorker: status queue closed");
    }
}

} // namespace BTR
