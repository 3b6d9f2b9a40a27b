#include "BTR/PosixPriorityBooster.h"
#include "BTR/Error.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <sched.h>

namespace BTR {

namespace {

class PosixPriorityHandle : public IPriorityHandle {
public:
    PosixPriorityHandle(pthread_t thread, int oldPolicy, sched_param oldParam,
                        std::shared_ptr<spdlog::logger> logger)
        : thread_(thread)
        , oldPolicy_(oldPolicy)
        , oldParam_(oldParam)
        , logger_(std::move(logger)) {}

    ~PosixPriorityHandle() override { release(); }

    void release() override {
        if (released_) {
            return;
        }
        released_ = true;
        int ret = pthread_setschedparam(thread_, oldPolicy_, &oldParam_);
        if (ret != 0) {
            logger_->warn("PosixPriorityHandle: failed to restore scheduling policy: {}", std::strerror(ret));
        } else {
            logger_->debug("PosixPriorityHandle: scheduling policy restored");
        }
    }

private:
    pthread_t thread_;
    int oldPolicy_;
    sched_param oldParam_;
    std::shared_ptr<spdlog::logger> logger_;
    bool released_{false};
};

} // namespace

PosixPriorityBooster::PosixPriorityBooster(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

std::optional<int> PosixPriorityBooster::priorityForProfile(const std::string& profileName) {
    if (profileName == "Pro Audio") {
        return 70;
    }
    if (profileName == "Audio") {
        return 50;
    }
    if (profileName == "Playback") {
        return 30;
    }
    return std::nullopt;
}

std::expected<std::unique_ptr<IPriorityHandle>, std::error_code>
PosixPriorityBooster::acquire(const std::string& profileName) {
    auto priority = priorityForProfile(profileName);
    if (!priority) {
        logger_->warn("PosixPriorityBooster: unknown profile '{}'", profileName);
        return std::unexpected(make_error_code(PlatformError::Unsupported));
    }

    pthread_t self = pthread_self();
    int oldPolicy = 0;
    sched_param oldParam{};
    int ret = pthread_getschedparam(self, &oldPolicy, &oldParam);
    if (ret != 0) {
        return std::unexpected(std::error_code(ret, std::generic_category()));
    }

    sched_param param{};
    param.sched_priority = std::clamp(*priority,
                                      sched_get_priority_min(SCHED_FIFO),
                                      sched_get_priority_max(SCHED_FIFO));
    ret = pthread_setschedparam(self, SCHED_FIFO, &param);
    if (ret == EPERM) {
        return std::unexpected(make_error_code(PlatformError::NotPermitted));
    }
    if (ret != 0) {
        return std::unexpected(std::error_code(ret, std::generic_category()));
    }

    logger_->debug("PosixPriorityBooster: '{}' -> SCHED_FIFO {}", profileName, param.sched_priority);
    return std::make_unique<PosixPriorityHandle>(self, oldPolicy, oldParam, logger_);
}

} // namespace BTR
