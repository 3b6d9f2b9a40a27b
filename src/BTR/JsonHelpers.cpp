#include "BTR/JsonHelpers.hpp"
#include <nlohmann/json.hpp>

namespace BTR::JsonHelpers {

json deviceToJson(const Device& device) {
    return json{{"name", device.displayName}, {"id", device.identifier}};
}

json devicesToJson(const std::vector<Device>& devices) {
    json arr = json::array();
    for (const auto& device : devices) {
        arr.push_back(deviceToJson(device));
    }
    return arr;
}

json statusToJson(const std::optional<std::string>& connected,
                  const std::vector<Device>& devices,
                  bool autostart) {
    json j;
    j["connected"] = connected ? json(*connected) : json(nullptr);
    j["devices"] = devicesToJson(devices);
    j["autostart"] = autostart;
    return j;
}

} // namespace BTR::JsonHelpers
