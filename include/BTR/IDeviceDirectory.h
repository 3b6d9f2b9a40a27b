// include/BTR/IDeviceDirectory.h
#pragma once

#include <expected>
#include <vector>
#include "BTR/Device.h"
#include "BTR/Error.h"

namespace BTR {

/**
 * @brief Read-only view of the platform's sink-capable devices
 *
 * Implementations never partially populate a result: a query either
 * returns every matching device or DirectoryError::DirectoryUnavailable.
 */
class IDeviceDirectory {
public:
    virtual ~IDeviceDirectory() = default;

    /**
     * @brief Enumerate paired devices that can relay audio to this sink
     * @return Devices in platform order, or DirectoryUnavailable
     */
    virtual std::expected<std::vector<Device>, DirectoryError> list() = 0;
};

} // namespace BTR
