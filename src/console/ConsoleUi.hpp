#pragma once

#include "BTR/Autostart.hpp"
#include "BTR/CommandWorker.h"
#include "UiLogSink.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace BTR {

/**
 * @class ConsoleUi
 * @brief Terminal front end: reads commands from stdin and renders the menu.
 *
 * The loop never blocks on the worker. Each tick it polls stdin for up to
 * the poll interval, drains both event queues and re-renders only when
 * something changed.
 */
class ConsoleUi {
public:
    using Submitter = std::function<bool(Command)>;

    ConsoleUi(std::shared_ptr<WorkerChannels> channels,
              Submitter submit,
              Autostart autostart,
              std::ostream& out,
              std::shared_ptr<ui_log_sink_mt> logSink = nullptr);

    /**
     * @brief Run until `quit`, end of input, or stopRequested becomes true
     */
    void run(std::chrono::milliseconds pollInterval, const std::atomic<bool>& stopRequested);

    /**
     * @brief Handle one line of user input
     * @return False when the user asked to quit
     */
    bool handleLine(const std::string& line);

    /**
     * @brief Append raw input and handle every complete line in it
     *
     * A trailing partial line is kept until its newline arrives.
     * @return False when one of the lines asked to quit
     */
    bool feedInput(const char* data, size_t size);

    /**
     * @brief Pull every pending event from the worker
     * @return True if the device list or the connection status changed
     */
    bool drainEvents();

    void render();

    const std::vector<Device>& devices() const { return devices_; }
    const std::optional<std::string>& connected() const { return connected_; }

private:
    void submit(Command command);
    void printHelp();
    std::optional<Device> findDevice(const std::string& selector) const;

    std::shared_ptr<WorkerChannels> channels_;
    Submitter submit_;
    Autostart autostart_;
    std::ostream& out_;
    std::shared_ptr<ui_log_sink_mt> logSink_;

    std::vector<Device> devices_;
    std::optional<std::string> connected_;
    std::string pendingInput_;
};

} // namespace BTR
