// include/BTR/CommandWorker.h
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "BTR/BoundedQueue.hpp"
#include "BTR/Commands.hpp"
#include "BTR/ConnectionManager.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @brief Queues shared between the UI adapter and the command worker
 */
struct WorkerChannels {
    explicit WorkerChannels(std::size_t commandCapacity = 10, std::size_t eventCapacity = 10)
        : commands(commandCapacity)
        , deviceLists(eventCapacity)
        , statuses(eventCapacity) {}

    BoundedQueue<Command> commands;
    BoundedQueue<DeviceListEvent> deviceLists;
    BoundedQueue<ConnectionStatusEvent> statuses;
};

/**
 * @brief Single consumer that serializes every connection state change
 *
 * The worker is the sole owner of the ConnectionManager. It pops one
 * command at a time, runs it to completion (including platform I/O) and
 * publishes the resulting events. No two commands ever overlap.
 */
class CommandWorker {
public:
    CommandWorker(std::unique_ptr<ConnectionManager> manager,
                  std::shared_ptr<WorkerChannels> channels,
                  bool scanOnStart = true,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Stops the worker if still running
     */
    ~CommandWorker();

    CommandWorker(const CommandWorker&) = delete;
    CommandWorker& operator=(const CommandWorker&) = delete;

    /**
     * @brief Spawn the worker thread
     * @return False if already running or the thread could not be created
     */
    bool start();

    /**
     * @brief Close all queues, join the worker and leave the manager Disconnected
     *
     * Commands still queued are processed; their events are dropped.
     */
    void stop();

    /**
     * @brief Non-blocking submission; a full or closed queue drops the command
     */
    bool submit(Command command);

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Number of commands fully processed so far
     */
    std::uint64_t processedCount() const { return processed_.load(); }

    /**
     * @brief Only safe once the worker has stopped
     */
    const ConnectionManager& manager() const { return *manager_; }

private:
    void run();
    void dispatch(const Command& command);

    void handleScan();
    void handleConnect(const ConnectCommand& command);
    void handleReconnect(const ReconnectCommand& command);
    void handleDisconnect();

    std::optional<Device> resolve(const std::string& displayName,
                                  const std::optional<std::string>& identifier);
    void publishDevices(std::vector<Device> devices);
    void publishStatus(std::optional<std::string> displayName);

    std::unique_ptr<ConnectionManager> manager_;
    std::shared_ptr<WorkerChannels> channels_;
    const bool scanOnStart_;
    std::shared_ptr<spdlog::logger> logger_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> processed_{0};
};

} // namespace BTR
