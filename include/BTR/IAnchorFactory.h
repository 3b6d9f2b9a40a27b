// include/BTR/IAnchorFactory.h
#pragma once

#include <expected>
#include <memory>
#include <system_error>

namespace BTR {

enum class AnchorQuality {
    LowestLatency,
    Default
};

/**
 * @brief A running, near-silent output stream that keeps the audio subsystem active
 */
class IAnchorStream {
public:
    virtual ~IAnchorStream() = default;

    /**
     * @brief Stop feeding the stream. Idempotent.
     */
    virtual void stop() = 0;

    /**
     * @brief Release the underlying output. Idempotent; implies stop().
     */
    virtual void close() = 0;

    virtual bool isRunning() const = 0;
};

class IAnchorFactory {
public:
    virtual ~IAnchorFactory() = default;

    /**
     * @brief Create and start an anchor stream
     * @param quality Latency hint for the output buffer
     */
    virtual std::expected<std::unique_ptr<IAnchorStream>, std::error_code>
        create(AnchorQuality quality) = 0;
};

} // namespace BTR
