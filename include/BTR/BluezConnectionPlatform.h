// include/BTR/BluezConnectionPlatform.h
#pragma once

#include <memory>
#include <string>
#include "BTR/CommandRunner.hpp"
#include "BTR/IConnectionPlatform.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @brief Audio connection primitive backed by BlueZ through bluetoothctl
 *
 * Keepalive calls may run on the heartbeat thread while the worker runs
 * open(); each call spawns its own bluetoothctl process and shares no state.
 */
class BluezConnectionPlatform : public IConnectionPlatform {
public:
    BluezConnectionPlatform(std::shared_ptr<ICommandRunner> runner,
                            std::string bluetoothctl = "bluetoothctl",
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    std::expected<std::unique_ptr<IConnectionHandle>, OpenStatus>
        open(const std::string& identifier) override;

    /**
     * @brief Query the link and re-issue connect only if it dropped
     */
    std::expected<void, OpenStatus> lightKeepalive(const std::string& identifier) override;

    /**
     * @brief Unconditional connect round-trip
     */
    std::expected<void, OpenStatus> heavyKeepalive(const std::string& identifier) override;

    /**
     * @brief Map `bluetoothctl connect` output to an open status
     */
    static OpenStatus parseConnectOutput(int exitCode, const std::string& output);

private:
    OpenStatus runConnect(const std::string& identifier);

    std::shared_ptr<ICommandRunner> runner_;
    std::string bluetoothctl_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace BTR
