#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <system_error>

namespace BTR {

/**
 * @class Autostart
 * @brief XDG autostart entry that launches btreceiver at login
 */
class Autostart {
public:
    static constexpr const char* kEntryName = "btreceiver.desktop";

    Autostart(std::filesystem::path autostartDir, std::filesystem::path executable);

    /**
     * @brief Entry in $XDG_CONFIG_HOME/autostart for the running executable
     */
    static Autostart forCurrentUser();

    bool isEnabled() const;
    std::expected<void, std::error_code> setEnabled(bool enable);

    std::filesystem::path entryPath() const { return autostartDir_ / kEntryName; }
    std::string desktopEntry() const;

private:
    std::filesystem::path autostartDir_;
    std::filesystem::path executable_;
};

} // namespace BTR
