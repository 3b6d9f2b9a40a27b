#include "BTR/Autostart.hpp"
#include "BTR/Config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace BTR {

Autostart::Autostart(std::filesystem::path autostartDir, std::filesystem::path executable)
    : autostartDir_(std::move(autostartDir))
    , executable_(std::move(executable)) {
}

Autostart Autostart::forCurrentUser() {
    // defaultConfigPath() is <config home>/btreceiver/config.json
    auto configHome = defaultConfigPath().parent_path().parent_path();
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        spdlog::warn("Autostart: cannot resolve executable path: {}", ec.message());
        exe = "btreceiver";
    }
    return Autostart(configHome / "autostart", exe);
}

std::string Autostart::desktopEntry() const {
    return "[Desktop Entry]\n"
           "Type=Application\n"
           "Name=BT Audio Receiver\n"
           "Comment=Keep the Bluetooth audio link awake\n"
           "Exec=\"" + executable_.string() + "\"\n"
           "Terminal=false\n"
           "X-GNOME-Autostart-enabled=true\n";
}

bool Autostart::isEnabled() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(entryPath(), ec);
}

std::expected<void, std::error_code> Autostart::setEnabled(bool enable) {
    std::error_code ec;
    if (!enable) {
        std::filesystem::remove(entryPath(), ec);
        if (ec) {
            spdlog::error("Autostart: cannot remove {}: {}", entryPath().string(), ec.message());
            return std::unexpected(ec);
        }
        spdlog::info("Autostart disabled");
        return {};
    }

    std::filesystem::create_directories(autostartDir_, ec);
    if (ec) {
        spdlog::error("Autostart: cannot create {}: {}", autostartDir_.string(), ec.message());
        return std::unexpected(ec);
    }
    std::ofstream out(entryPath(), std::ios::trunc);
    out << desktopEntry();
    out.close();
    if (!out) {
        spdlog::error("Autostart: cannot write {}", entryPath().string());
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    spdlog::info("Autostart enabled ({})", entryPath().string());
    return {};
}

} // namespace BTR
