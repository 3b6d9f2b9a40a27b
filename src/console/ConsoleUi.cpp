#include "ConsoleUi.hpp"
#include "BTR/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>
#include <poll.h>
#include <unistd.h>

namespace BTR {

namespace {

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// Everything after the first word, leading blanks removed.
std::string argumentOf(const std::string& line) {
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {};
    }
    auto space = line.find_first_of(" \t", start);
    if (space == std::string::npos) {
        return {};
    }
    auto arg = line.find_first_not_of(" \t", space);
    if (arg == std::string::npos) {
        return {};
    }
    auto end = line.find_last_not_of(" \t\r\n");
    return line.substr(arg, end - arg + 1);
}

bool isNumber(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ConsoleUi::ConsoleUi(std::shared_ptr<WorkerChannels> channels,
                     Submitter submit,
                     Autostart autostart,
                     std::ostream& out,
                     std::shared_ptr<ui_log_sink_mt> logSink)
    : channels_(std::move(channels))
    , submit_(std::move(submit))
    , autostart_(std::move(autostart))
    , out_(out)
    , logSink_(std::move(logSink)) {
}

void ConsoleUi::run(std::chrono::milliseconds pollInterval, const std::atomic<bool>& stopRequested) {
    printHelp();
    render();

    while (!stopRequested.load()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(pollInterval.count()));
        if (ready < 0 && errno != EINTR) {
            spdlog::error("ConsoleUi: poll failed: {}", std::strerror(errno));
            return;
        }
        if (ready > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            char buffer[512];
            ssize_t count = ::read(STDIN_FILENO, buffer, sizeof(buffer));
            if (count < 0 && errno != EINTR && errno != EAGAIN) {
                spdlog::error("ConsoleUi: read failed: {}", std::strerror(errno));
                return;
            }
            if (count == 0) {
                if (!pendingInput_.empty()) {
                    handleLine(std::exchange(pendingInput_, {}));
                }
                spdlog::info("ConsoleUi: end of input");
                return;
            }
            if (count > 0 && !feedInput(buffer, static_cast<size_t>(count))) {
                return;
            }
        }

        if (drainEvents()) {
            render();
        }
    }
}

bool ConsoleUi::handleLine(const std::string& line) {
    auto words = splitWords(line);
    if (words.empty()) {
        return true;
    }
    const std::string& verb = words.front();

    if (verb == "quit" || verb == "exit" || verb == "q") {
        return false;
    }
    if (verb == "help" || verb == "?") {
        printHelp();
    } else if (verb == "scan" || verb == "refresh") {
        submit(ScanCommand{});
    } else if (verb == "disconnect") {
        submit(DisconnectCommand{});
    } else if (verb == "connect") {
        std::string selector = argumentOf(line);
        if (selector.empty()) {
            out_ << "usage: connect <number|name>\n";
            return true;
        }
        if (auto device = findDevice(selector)) {
            submit(ConnectCommand{device->displayName, device->identifier});
        } else if (isNumber(selector)) {
            out_ << "no device #" << selector << "\n";
        } else {
            submit(ConnectCommand{selector, std::nullopt});
        }
    } else if (verb == "reconnect") {
        std::string name = argumentOf(line);
        if (name.empty()) {
            if (!connected_) {
                out_ << "not connected\n";
                return true;
            }
            name = *connected_;
        }
        auto device = findDevice(name);
        submit(ReconnectCommand{name, device ? std::optional<std::string>(device->identifier) : std::nullopt});
    } else if (verb == "autostart") {
        if (words.size() != 2 || (words[1] != "on" && words[1] != "off")) {
            out_ << "usage: autostart on|off\n";
            return true;
        }
        auto result = autostart_.setEnabled(words[1] == "on");
        if (!result) {
            out_ << "autostart: " << result.error().message() << "\n";
        }
        render();
    } else if (verb == "status") {
        out_ << JsonHelpers::statusToJson(connected_, devices_, autostart_.isEnabled()).dump(2) << "\n";
    } else {
        out_ << "unknown command '" << verb << "' (try help)\n";
    }
    return true;
}

bool ConsoleUi::feedInput(const char* data, size_t size) {
    pendingInput_.append(data, size);
    size_t newline;
    while ((newline = pendingInput_.find('\n')) != std::string::npos) {
        std::string line = pendingInput_.substr(0, newline);
        pendingInput_.erase(0, newline + 1);
        if (!handleLine(line)) {
            return false;
        }
    }
    return true;
}

bool ConsoleUi::drainEvents() {
    bool changed = false;
    while (auto event = channels_->deviceLists.tryPop()) {
        devices_ = std::move(event->devices);
        changed = true;
    }
    while (auto event = channels_->statuses.tryPop()) {
        connected_ = std::move(event->displayName);
        changed = true;
    }
    return changed;
}

void ConsoleUi::render() {
    out_ << "\n";
    if (connected_) {
        out_ << "  [connected] " << *connected_ << "\n";
        out_ << "  reconnect | disconnect\n";
        out_ << "  ----\n";
    }

    int index = 0;
    bool any = false;
    for (const auto& device : devices_) {
        if (connected_ && *connected_ == device.displayName) {
            continue;
        }
        out_ << "  " << ++index << ") " << device.displayName << "  [" << device.identifier << "]\n";
        any = true;
    }
    if (!any && devices_.empty()) {
        out_ << "  (no devices)\n";
    }

    out_ << "  ----\n";
    out_ << "  scan | autostart " << (autostart_.isEnabled() ? "[on]" : "[off]") << " | quit\n";

    if (logSink_) {
        for (const auto& line : logSink_->recent()) {
            out_ << "  ! " << line << "\n";
        }
    }
    out_ << "> " << std::flush;
}

void ConsoleUi::submit(Command command) {
    if (!submit_(std::move(command))) {
        out_ << "busy: command dropped, try again\n";
    }
}

void ConsoleUi::printHelp() {
    out_ << "commands: scan, connect <number|name>, reconnect [name], disconnect,\n"
            "          autostart on|off, status, help, quit\n";
}

std::optional<Device> ConsoleUi::findDevice(const std::string& selector) const {
    if (isNumber(selector)) {
        if (selector.size() > 6) {
            return std::nullopt;
        }
        // Numbers refer to the rendered list, which hides the connected device.
        int wanted = std::stoi(selector);
        int index = 0;
        for (const auto& device : devices_) {
            if (connected_ && *connected_ == device.displayName) {
                continue;
            }
            if (++index == wanted) {
                return device;
            }
        }
        return std::nullopt;
    }
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&](const Device& device) { return device.displayName == selector; });
    if (it != devices_.end()) {
        return *it;
    }
    return std::nullopt;
}

} // namespace BTR
