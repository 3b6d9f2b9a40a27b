// include/BTR/Error.h
// Synopsis: Error codes for the connection core and the platform backends.

#pragma once

#include <string>
#include <system_error>

namespace BTR {

/**
 * @brief Status reported by the platform when opening an audio connection
 */
enum class OpenStatus {
    Success = 0,            // Connection is open
    RequestTimedOut,        // Remote device did not answer in time
    DeniedBySystem,         // Stack or policy refused the connection
    DeviceNotAvailable,     // Device unknown, out of range or powered off
    UnknownFailure          // Anything the backend could not classify
};

/**
 * @brief Failure kinds of ConnectionManager::connect / reconnect
 */
enum class ConnectErrc {
    IdentifierMissing = 1,  // No identifier was ever resolved for the device
    OpenFailed,             // Platform rejected or failed the open
    AnchorFailed,           // Silent anchor stream could not be created
    DeviceNotFound          // Name resolution in the worker found no match
};

enum class DirectoryError {
    DirectoryUnavailable = 1  // Enumeration query failed
};

/**
 * @brief Errors of the best-effort platform resources (anchor, priority, runner)
 */
enum class PlatformError {
    CommandFailed = 1,      // Helper process could not be spawned or failed
    Unsupported,            // Unknown profile or capability
    NotPermitted,           // Missing privileges (e.g. realtime scheduling)
    ResourceBusy            // Resource is already held
};

namespace detail {
    struct OpenStatusCategory : std::error_category {
        const char* name() const noexcept override { return "BTR.OpenStatus"; }
        std::string message(int ev) const override {
            switch (static_cast<OpenStatus>(ev)) {
                case OpenStatus::Success: return "Success";
                case OpenStatus::RequestTimedOut: return "Request timed out";
                case OpenStatus::DeniedBySystem: return "Denied by system";
                case OpenStatus::DeviceNotAvailable: return "Device not available";
                case OpenStatus::UnknownFailure: return "Unknown failure";
                default: return "Unknown open status";
            }
        }
    };

    struct ConnectErrorCategory : std::error_category {
        const char* name() const noexcept override { return "BTR.Connect"; }
        std::string message(int ev) const override {
            switch (static_cast<ConnectErrc>(ev)) {
                case ConnectErrc::IdentifierMissing: return "Device identifier not resolved";
                case ConnectErrc::OpenFailed: return "Platform failed to open the connection";
                case ConnectErrc::AnchorFailed: return "Anchor stream could not be created";
                case ConnectErrc::DeviceNotFound: return "Device not found";
                default: return "Unknown connect error";
            }
        }
    };

    struct DirectoryErrorCategory : std::error_category {
        const char* name() const noexcept override { return "BTR.Directory"; }
        std::string message(int ev) const override {
            switch (static_cast<DirectoryError>(ev)) {
                case DirectoryError::DirectoryUnavailable: return "Device directory unavailable";
                default: return "Unknown directory error";
            }
        }
    };

    struct PlatformErrorCategory : std::error_category {
        const char* name() const noexcept override { return "BTR.Platform"; }
        std::string message(int ev) const override {
            switch (static_cast<PlatformError>(ev)) {
                case PlatformError::CommandFailed: return "Helper command failed";
                case PlatformError::Unsupported: return "Unsupported";
                case PlatformError::NotPermitted: return "Operation not permitted";
                case PlatformError::ResourceBusy: return "Resource busy";
                default: return "Unknown platform error";
            }
        }
    };
}

inline const std::error_category& open_status_category() noexcept {
    static detail::OpenStatusCategory category;
    return category;
}

inline const std::error_category& connect_error_category() noexcept {
    static detail::ConnectErrorCategory category;
    return category;
}

inline const std::error_category& directory_error_category() noexcept {
    static detail::DirectoryErrorCategory category;
    return category;
}

inline const std::error_category& platform_error_category() noexcept {
    static detail::PlatformErrorCategory category;
    return category;
}

inline std::error_code make_error_code(OpenStatus e) noexcept {
    return {static_cast<int>(e), open_status_category()};
}

inline std::error_code make_error_code(ConnectErrc e) noexcept {
    return {static_cast<int>(e), connect_error_category()};
}

inline std::error_code make_error_code(DirectoryError e) noexcept {
    return {static_cast<int>(e), directory_error_category()};
}

inline std::error_code make_error_code(PlatformError e) noexcept {
    return {static_cast<int>(e), platform_error_category()};
}

/**
 * @brief Typed failure of connect / reconnect
 *
 * Carries the platform open status for OpenFailed and marks failures that
 * happened while reconnecting.
 */
struct ConnectError {
    ConnectErrc code;
    OpenStatus openStatus = OpenStatus::Success;
    bool duringReconnect = false;

    std::error_code errorCode() const noexcept { return make_error_code(code); }

    std::string message() const {
        std::string text = duringReconnect ? "Reconnect failed: " : "";
        text += connect_error_category().message(static_cast<int>(code));
        if (code == ConnectErrc::OpenFailed) {
            text += " (";
            text += open_status_category().message(static_cast<int>(openStatus));
            text += ")";
        }
        return text;
    }
};

} // namespace BTR

namespace std {
    template<>
    struct is_error_code_enum<BTR::OpenStatus> : true_type {};
    template<>
    struct is_error_code_enum<BTR::ConnectErrc> : true_type {};
    template<>
    struct is_error_code_enum<BTR::DirectoryError> : true_type {};
    template<>
    struct is_error_code_enum<BTR::PlatformError> : true_type {};
}
