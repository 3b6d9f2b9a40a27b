// include/BTR/IPriorityBooster.h
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <system_error>

namespace BTR {

/**
 * @brief Scheduling boost held by the calling thread; released on destruction
 */
class IPriorityHandle {
public:
    virtual ~IPriorityHandle() = default;

    /**
     * @brief Revert the boost. Idempotent.
     */
    virtual void release() = 0;
};

/**
 * @brief Best-effort scheduling priority boost
 *
 * Callers log acquisition failures and carry on; a missing boost never
 * gates the primary connection.
 */
class IPriorityBooster {
public:
    virtual ~IPriorityBooster() = default;

    virtual std::expected<std::unique_ptr<IPriorityHandle>, std::error_code>
        acquire(const std::string& profileName) = 0;
};

} // namespace BTR
