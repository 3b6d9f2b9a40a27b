// test/BluezDeviceDirectoryTests.cpp
#include <catch2/catch_test_macros.hpp>
#include "BTR/BluezDeviceDirectory.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

// Answers bluetoothctl invocations from a table keyed by the joined argv.
class ScriptedRunner : public BTR::ICommandRunner {
public:
    std::expected<BTR::CommandResult, std::error_code> run(const std::vector<std::string>& argv) override {
        std::string key;
        for (const auto& arg : argv) {
            key += key.empty() ? arg : " " + arg;
        }
        calls.push_back(key);
        auto it = responses.find(key);
        if (it == responses.end()) {
            return BTR::CommandResult{1, "unexpected command"};
        }
        return it->second;
    }

    std::map<std::string, BTR::CommandResult> responses;
    std::vector<std::string> calls;
};

const char* kPairedOutput =
    "Device 00:1A:7D:DA:71:13 Pixel 7\n"
    "Device 40:EF:4C:8A:2B:01 Headphones\n"
    "Device 11:22:33:44:55:66\n";

const char* kPhoneInfo =
    "Device 00:1A:7D:DA:71:13 (public)\n"
    "\tName: Pixel 7\n"
    "\tAlias: Pixel 7\n"
    "\tPaired: yes\n"
    "\tTrusted: yes\n"
    "\tConnected: no\n"
    "\tUUID: Audio Source              (0000110a-0000-1000-8000-00805f9b34fb)\n"
    "\tUUID: A/V Remote Control Target (0000110c-0000-1000-8000-00805f9b34fb)\n";

const char* kHeadphonesInfo =
    "Device 40:EF:4C:8A:2B:01 (public)\n"
    "\tName: Headphones\n"
    "\tPaired: yes\n"
    "\tConnected: yes\n"
    "\tUUID: Audio Sink                (0000110b-0000-1000-8000-00805f9b34fb)\n";

const char* kUnnamedInfo =
    "Device 11:22:33:44:55:66 (random)\n"
    "\tPaired: yes\n"
    "\tUUID: Audio Source              (0000110A-0000-1000-8000-00805F9B34FB)\n";

} // namespace

TEST_CASE("BluezDeviceDirectory - Parsing bluetoothctl output", "[directory]") {
    SECTION("devices lines give identifier and name") {
        auto devices = BTR::BluezDeviceDirectory::parseDeviceLines(kPairedOutput);
        REQUIRE(devices.size() == 3);
        CHECK(devices[0].identifier == "00:1A:7D:DA:71:13");
        CHECK(devices[0].displayName == "Pixel 7");
        CHECK(devices[1].displayName == "Headphones");
        // Unnamed devices fall back to their address.
        CHECK(devices[2].displayName == "11:22:33:44:55:66");
    }

    SECTION("noise lines are ignored") {
        auto devices = BTR::BluezDeviceDirectory::parseDeviceLines(
            "[bluetooth]# \nAgent registered\nDevice 00:1A\n");
        CHECK(devices.empty());
    }

    SECTION("info block") {
        auto info = BTR::BluezDeviceDirectory::parseInfo(kPhoneInfo);
        CHECK(info.address == "00:1A:7D:DA:71:13");
        CHECK(info.name == "Pixel 7");
        CHECK(info.paired);
        CHECK_FALSE(info.connected);
        REQUIRE(info.uuids.size() == 2);
        CHECK(info.isAudioSource());
    }

    SECTION("audio sinks are not sources") {
        auto info = BTR::BluezDeviceDirectory::parseInfo(kHeadphonesInfo);
        CHECK(info.connected);
        CHECK_FALSE(info.isAudioSource());
    }

    SECTION("UUID match is case-insensitive") {
        CHECK(BTR::BluezDeviceDirectory::parseInfo(kUnnamedInfo).isAudioSource());
    }
}

TEST_CASE("BluezDeviceDirectory - Listing", "[directory]") {
    auto runner = std::make_shared<ScriptedRunner>();
    BTR::BluezDeviceDirectory directory(runner);
    runner->responses["bluetoothctl devices Paired"] = {0, kPairedOutput};
    runner->responses["bluetoothctl info 00:1A:7D:DA:71:13"] = {0, kPhoneInfo};
    runner->responses["bluetoothctl info 40:EF:4C:8A:2B:01"] = {0, kHeadphonesInfo};
    runner->responses["bluetoothctl info 11:22:33:44:55:66"] = {0, kUnnamedInfo};

    SECTION("only audio sources are listed, in platform order") {
        auto devices = directory.list();
        REQUIRE(devices.has_value());
        REQUIRE(devices->size() == 2);
        CHECK(devices->at(0).displayName == "Pixel 7");
        CHECK(devices->at(1).identifier == "11:22:33:44:55:66");
    }

    SECTION("failed enumeration is DirectoryUnavailable") {
        runner->responses["bluetoothctl devices Paired"] = {1, "No default controller available"};
        auto devices = directory.list();
        REQUIRE_FALSE(devices.has_value());
        CHECK(devices.error() == BTR::DirectoryError::DirectoryUnavailable);
    }

    SECTION("a failed info query fails the whole listing") {
        runner->responses.erase("bluetoothctl info 40:EF:4C:8A:2B:01");
        auto devices = directory.list();
        REQUIRE_FALSE(devices.has_value());
        CHECK(runner->calls.size() == 3);
    }
}
