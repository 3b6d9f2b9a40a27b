#include "BTR/HeartbeatMonitor.hpp"
#include <spdlog/spdlog.h>

namespace BTR {

std::atomic<int> HeartbeatMonitor::s_active{0};

HeartbeatMonitor::HeartbeatMonitor(std::string identifier,
                                   IConnectionPlatform& platform,
                                   std::shared_ptr<const CancellationToken> token,
                                   HeartbeatSettings settings,
                                   std::shared_ptr<spdlog::logger> logger)
    : identifier_(std::move(identifier))
    , platform_(platform)
    , token_(std::move(token))
    , settings_(settings)
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

HeartbeatMonitor::~HeartbeatMonitor() {
    join();
}

bool HeartbeatMonitor::start() {
    if (thread_.joinable()) {
        logger_->warn("HeartbeatMonitor::start: already started for {}", identifier_);
        return false;
    }
    if (!token_ || token_->isCancelled()) {
        logger_->warn("HeartbeatMonitor::start: token for {} already cancelled", identifier_);
        return false;
    }

    try {
        running_.store(true);
        s_active.fetch_add(1);
        thread_ = std::thread(&HeartbeatMonitor::loop, this);
    } catch (const std::system_error& e) {
        running_.store(false);
        s_active.fetch_sub(1);
        logger_->error("HeartbeatMonitor::start: failed to spawn thread: {}", e.what());
        return false;
    }
    return true;
}

void HeartbeatMonitor::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HeartbeatMonitor::loop() {
    logger_->info("Heartbeat started for {} (interval {} ms, heavy every {} ticks)",
                  identifier_, settings_.interval.count(), settings_.heavyEvery);

    while (!token_->waitFor(settings_.interval)) {
        const std::uint64_t tick = ticks_.fetch_add(1) + 1;
        const bool heavyTick = settings_.heavyEvery != 0 && tick % settings_.heavyEvery == 0;

        try {
            auto light = platform_.lightKeepalive(identifier_);
            if (!light) {
                logger_->warn("Heartbeat tick {}: light keepalive on {} failed: {}",
                              tick, identifier_, make_error_code(light.error()).message());
            }
        } catch (const std::exception& e) {
            logger_->warn("Heartbeat tick {}: light keepalive on {} threw: {}", tick, identifier_, e.what());
        }
        lightCount_.fetch_add(1);

        if (heavyTick) {
            try {
                auto heavy = platform_.heavyKeepalive(identifier_);
                if (!heavy) {
                    logger_->warn("Heartbeat tick {}: heavy keepalive on {} failed: {}",
                                  tick, identifier_, make_error_code(heavy.error()).message());
                } else {
                    logger_->debug("Heartbeat tick {}: heavy keepalive on {}", tick, identifier_);
                }
            } catch (const std::exception& e) {
                logger_->warn("Heartbeat tick {}: heavy keepalive on {} threw: {}", tick, identifier_, e.what());
            }
            heavyCount_.fetch_add(1);
        } else {
            logger_->trace("Heartbeat tick {} on {}", tick, identifier_);
        }
    }

    logger_->info("Heartbeat stopped for {} after {} ticks", identifier_, ticks_.load());
    running_.store(false);
    s_active.fetch_sub(1);
}

} // namespace BTR
