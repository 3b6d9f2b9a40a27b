// include/BTR/PosixPriorityBooster.h
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "BTR/IPriorityBooster.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @brief Realtime scheduling boost for the calling thread
 *
 * Profile names follow the multimedia class scheduler naming ("Pro Audio",
 * "Audio", "Playback") and map to SCHED_FIFO priorities. The handle keeps
 * the thread's previous policy and restores it on release; release must
 * happen on the thread that acquired the boost.
 */
class PosixPriorityBooster : public IPriorityBooster {
public:
    explicit PosixPriorityBooster(std::shared_ptr<spdlog::logger> logger = nullptr);

    std::expected<std::unique_ptr<IPriorityHandle>, std::error_code>
        acquire(const std::string& profileName) override;

    /**
     * @brief SCHED_FIFO priority for a profile, or std::nullopt if unknown
     */
    static std::optional<int> priorityForProfile(const std::string& profileName);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace BTR
