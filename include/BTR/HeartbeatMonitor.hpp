#pragma once

#include "BTR/CancellationToken.hpp"
#include "BTR/Config.hpp"
#include "BTR/IConnectionPlatform.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @class HeartbeatMonitor
 * @brief Keeps one connection alive with periodic artificial activity.
 *
 * The platform power manager suspends audio links it judges idle. The
 * monitor defeats that by issuing a light keepalive against the connection
 * identifier every interval and a heavy keepalive every heavyEvery ticks.
 *
 * A monitor is bound to exactly one connection: it copies the identifier at
 * construction and only ever reads its cancellation token. Keepalive
 * failures are logged and swallowed; only cancellation ends the loop.
 */
class HeartbeatMonitor {
public:
    HeartbeatMonitor(std::string identifier,
                     IConnectionPlatform& platform,
                     std::shared_ptr<const CancellationToken> token,
                     HeartbeatSettings settings,
                     std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Joins the monitor thread. The token must already be cancelled
     *        or the destructor blocks until it is.
     */
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /**
     * @brief Spawn the monitor thread
     * @return False if already started or the thread could not be created
     */
    bool start();

    /**
     * @brief Wait for the monitor thread to exit after cancellation
     */
    void join();

    bool isRunning() const { return running_.load(); }
    const std::string& identifier() const { return identifier_; }

    std::uint64_t ticks() const { return ticks_.load(); }
    std::uint64_t lightKeepalives() const { return lightCount_.load(); }
    std::uint64_t heavyKeepalives() const { return heavyCount_.load(); }

    /**
     * @brief Live monitor threads across the process
     */
    static int activeCount() { return s_active.load(); }

private:
    void loop();

    const std::string identifier_;
    IConnectionPlatform& platform_;
    std::shared_ptr<const CancellationToken> token_;
    const HeartbeatSettings settings_;
    std::shared_ptr<spdlog::logger> logger_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> lightCount_{0};
    std::atomic<std::uint64_t> heavyCount_{0};

    static std::atomic<int> s_active;
};

} // namespace BTR
