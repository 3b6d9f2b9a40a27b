// include/BTR/IConnectionPlatform.h
#pragma once

#include <expected>
#include <memory>
#include <string>
#include "BTR/Error.h"

namespace BTR {

/**
 * @brief An open platform audio connection
 *
 * Owned exclusively by the ConnectionManager while it is Connected.
 */
class IConnectionHandle {
public:
    virtual ~IConnectionHandle() = default;

    virtual const std::string& identifier() const = 0;

    /**
     * @brief Tear the connection down. Best-effort, safe to call twice.
     */
    virtual void close() = 0;
};

/**
 * @brief Platform connection primitive
 *
 * open() is only ever called from the command worker. The keepalive calls
 * are issued by the heartbeat monitor thread and must be idempotent: a
 * keepalive against an already active link is a cheap no-op.
 */
class IConnectionPlatform {
public:
    virtual ~IConnectionPlatform() = default;

    /**
     * @brief Open an audio connection to the given identifier
     * @return Connection handle, or the non-success status the platform reported
     */
    virtual std::expected<std::unique_ptr<IConnectionHandle>, OpenStatus>
        open(const std::string& identifier) = 0;

    /**
     * @brief Lightweight re-open of an already open link
     */
    virtual std::expected<void, OpenStatus> lightKeepalive(const std::string& identifier) = 0;

    /**
     * @brief Full open round-trip that also resets platform idle timers
     */
    virtual std::expected<void, OpenStatus> heavyKeepalive(const std::string& identifier) = 0;
};

} // namespace BTR
