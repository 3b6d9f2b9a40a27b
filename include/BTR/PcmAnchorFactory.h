// include/BTR/PcmAnchorFactory.h
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "BTR/Config.hpp"
#include "BTR/IAnchorFactory.h"

namespace spdlog {
    class logger;
}

namespace BTR {

/**
 * @brief Anchor streams played through aplay
 *
 * Each stream is an aplay child fed near-silent 16-bit stereo frames from
 * a writer thread. The pipe back-pressure paces the writer at the device
 * rate. Callers must ignore SIGPIPE so a dead child surfaces as a write
 * error instead of terminating the process.
 */
class PcmAnchorFactory : public IAnchorFactory {
public:
    static constexpr unsigned kSampleRate = 48000;
    static constexpr unsigned kChannels = 2;
    static constexpr unsigned kFramesPerWrite = 256;
    /// How long create() lets aplay run before trusting the stream
    static constexpr std::chrono::milliseconds kStartupCheck{150};

    explicit PcmAnchorFactory(AnchorSettings settings,
                              std::string aplay = "aplay",
                              std::shared_ptr<spdlog::logger> logger = nullptr);

    std::expected<std::unique_ptr<IAnchorStream>, std::error_code>
        create(AnchorQuality quality) override;

    /**
     * @brief Sample magnitude for a gain in [0, 1]; at least 1 LSB for any non-zero gain
     */
    static int16_t amplitudeForGain(double gain);

    /**
     * @brief aplay buffer time in microseconds for the quality hint
     */
    static unsigned bufferTimeUs(AnchorQuality quality);

private:
    AnchorSettings settings_;
    std::string aplay_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace BTR
