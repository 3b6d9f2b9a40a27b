#include "BTR/BluezConnectionPlatform.h"
#include "BTR/BluezDeviceDirectory.h"
#include <spdlog/spdlog.h>

namespace BTR {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

class BluezConnectionHandle : public IConnectionHandle {
public:
    BluezConnectionHandle(std::string identifier,
                          std::shared_ptr<ICommandRunner> runner,
                          std::string bluetoothctl,
                          std::shared_ptr<spdlog::logger> logger)
        : identifier_(std::move(identifier))
        , runner_(std::move(runner))
        , bluetoothctl_(std::move(bluetoothctl))
        , logger_(std::move(logger)) {}

    ~BluezConnectionHandle() override { close(); }

    const std::string& identifier() const override { return identifier_; }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        auto result = runner_->run({bluetoothctl_, "disconnect", identifier_});
        if (!result || result->exitCode != 0) {
            logger_->warn("BluezConnectionHandle: disconnect of {} did not complete cleanly", identifier_);
        } else {
            logger_->debug("BluezConnectionHandle: {} disconnected", identifier_);
        }
    }

private:
    std::string identifier_;
    std::shared_ptr<ICommandRunner> runner_;
    std::string bluetoothctl_;
    std::shared_ptr<spdlog::logger> logger_;
    bool closed_{false};
};

} // namespace

BluezConnectionPlatform::BluezConnectionPlatform(std::shared_ptr<ICommandRunner> runner,
                                                 std::string bluetoothctl,
                                                 std::shared_ptr<spdlog::logger> logger)
    : runner_(std::move(runner))
    , bluetoothctl_(std::move(bluetoothctl))
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

OpenStatus BluezConnectionPlatform::parseConnectOutput(int exitCode, const std::string& output) {
    if (contains(output, "Connection successful")) {
        return OpenStatus::Success;
    }
    if (contains(output, "not available") || contains(output, "NotAvailable")) {
        return OpenStatus::DeviceNotAvailable;
    }
    if (contains(output, "timeout") || contains(output, "Timeout") || contains(output, "NoReply")) {
        return OpenStatus::RequestTimedOut;
    }
    if (contains(output, "NotReady") || contains(output, "NotPermitted") ||
        contains(output, "AuthenticationRejected") || contains(output, "Rejected") ||
        contains(output, "Blocked") || contains(output, "blocked")) {
        return OpenStatus::DeniedBySystem;
    }
    // Some bluetoothctl versions print nothing useful but still succeed.
    if (exitCode == 0 && !contains(output, "Failed")) {
        return OpenStatus::Success;
    }
    return OpenStatus::UnknownFailure;
}

OpenStatus BluezConnectionPlatform::runConnect(const std::string& identifier) {
    auto result = runner_->run({bluetoothctl_, "connect", identifier});
    if (!result) {
        logger_->error("BluezConnectionPlatform: cannot run {}: {}", bluetoothctl_, result.error().message());
        return OpenStatus::UnknownFailure;
    }
    return parseConnectOutput(result->exitCode, result->output);
}

std::expected<std::unique_ptr<IConnectionHandle>, OpenStatus>
BluezConnectionPlatform::open(const std::string& identifier) {
    OpenStatus status = runConnect(identifier);
    if (status != OpenStatus::Success) {
        return std::unexpected(status);
    }
    return std::make_unique<BluezConnectionHandle>(identifier, runner_, bluetoothctl_, logger_);
}

std::expected<void, OpenStatus> BluezConnectionPlatform::lightKeepalive(const std::string& identifier) {
    auto info = runner_->run({bluetoothctl_, "info", identifier});
    if (info && info->exitCode == 0 && BluezDeviceDirectory::parseInfo(info->output).connected) {
        return {};
    }

    logger_->info("BluezConnectionPlatform: link to {} dropped, re-opening", identifier);
    OpenStatus status = runConnect(identifier);
    if (status != OpenStatus::Success) {
        return std::unexpected(status);
    }
    return {};
}

std::expected<void, OpenStatus> BluezConnectionPlatform::heavyKeepalive(const std::string& identifier) {
    OpenStatus status = runConnect(identifier);
    if (status != OpenStatus::Success) {
        return std::unexpected(status);
    }
    return {};
}

} // namespace BTR
