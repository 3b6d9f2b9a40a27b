#pragma once
#include "BTR/Device.h"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace BTR::JsonHelpers {
    using json = nlohmann::json;

    json deviceToJson(const Device& device);
    json devicesToJson(const std::vector<Device>& devices);
    json statusToJson(const std::optional<std::string>& connected,
                      const std::vector<Device>& devices,
                      bool autostart);
}
