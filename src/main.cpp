/**
 * @file main.cpp
 * @brief Entry point of btreceiver: wires the BlueZ backends, the command
 *        worker and the console menu together.
 */

#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <getopt.h>
#include <unistd.h>

#include "BTR/Autostart.hpp"
#include "BTR/BluezConnectionPlatform.h"
#include "BTR/BluezDeviceDirectory.h"
#include "BTR/CommandRunner.hpp"
#include "BTR/CommandWorker.h"
#include "BTR/Config.hpp"
#include "BTR/ConnectionManager.h"
#include "BTR/PcmAnchorFactory.h"
#include "BTR/PosixPriorityBooster.h"
#include "console/ConsoleUi.hpp"
#include "console/UiLogSink.hpp"

namespace {

std::atomic<bool> g_stopRequested = false;

void signalHandler(int) {
    if (g_stopRequested.exchange(true)) {
        _exit(1);
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  -c, --config PATH   configuration file (default: "
              << BTR::defaultConfigPath().string() << ")\n"
              << "  -v, --verbose       log at debug level\n"
              << "  -h, --help          show this help\n";
}

struct Options {
    std::string configPath;
    bool verbose = false;
};

} // namespace

int main(int argc, char** argv) {
    Options options;
    options.configPath = BTR::defaultConfigPath().string();

    static const option longOptions[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:vh", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.configPath = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'h':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 2;
        }
    }

    std::unique_ptr<BTR::CommandWorker> worker;
    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto uiSink = std::make_shared<BTR::ui_log_sink_mt>(3);
        std::vector<spdlog::sink_ptr> sinks{consoleSink, uiSink};
        auto logger = std::make_shared<spdlog::logger>("btreceiver", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);

        auto config = BTR::loadConfig(options.configPath);
        if (!config) {
            spdlog::critical("Cannot load {}: {}", options.configPath,
                             BTR::make_error_code(config.error()).message());
            return 1;
        }

        if (!config->logFile.empty()) {
            logger->sinks().push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config->logFile));
        }
        if (!options.verbose) {
            spdlog::set_level(spdlog::level::from_str(config->logLevel));
        }
        logger->flush_on(spdlog::level::warn);
        spdlog::info("btreceiver starting...");
        spdlog::debug("Effective configuration: {}", config->toJson().dump());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        // Anchor streams write into aplay pipes; a dead child must not kill us.
        std::signal(SIGPIPE, SIG_IGN);

        auto runner = std::make_shared<BTR::PopenCommandRunner>();
        BTR::PlatformServices services;
        services.directory = std::make_shared<BTR::BluezDeviceDirectory>(runner, config->bluetoothctlPath, logger);
        services.connections = std::make_shared<BTR::BluezConnectionPlatform>(runner, config->bluetoothctlPath, logger);
        services.anchors = std::make_shared<BTR::PcmAnchorFactory>(config->anchor, "aplay", logger);
        services.priority = std::make_shared<BTR::PosixPriorityBooster>(logger);

        auto manager = std::make_unique<BTR::ConnectionManager>(std::move(services), *config, logger);
        auto channels = std::make_shared<BTR::WorkerChannels>(config->commandQueueCapacity,
                                                              config->eventQueueCapacity);
        worker = std::make_unique<BTR::CommandWorker>(std::move(manager), channels, config->scanOnStart, logger);
        if (!worker->start()) {
            spdlog::critical("Failed to start the command worker");
            return 1;
        }

        BTR::ConsoleUi ui(channels,
                          [&worker](BTR::Command command) { return worker->submit(std::move(command)); },
                          BTR::Autostart::forCurrentUser(),
                          std::cout,
                          uiSink);
        ui.run(config->uiPollInterval, g_stopRequested);

        spdlog::info("Shutting down...");
        worker->stop();
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        if (worker) { worker->stop(); }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "An error occurred: " << ex.what() << std::endl;
        if (worker) { worker->stop(); }
        return 1;
    }

    spdlog::info("btreceiver finished cleanly.");
    spdlog::default_logger()->flush();
    return 0;
}
