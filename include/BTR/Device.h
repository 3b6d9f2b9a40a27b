// include/BTR/Device.h
#pragma once

#include <string>

namespace BTR {

/**
 * @brief A sink-capable device as reported by the device directory
 *
 * Records are transient: a fresh list is produced by every directory query.
 * The identifier is stable and platform-assigned (a Bluetooth address on
 * Linux); display names are not guaranteed to be unique.
 */
struct Device {
    std::string displayName;
    std::string identifier;

    bool hasIdentifier() const { return !identifier.empty(); }

    bool operator==(const Device&) const = default;
};

} // namespace BTR
