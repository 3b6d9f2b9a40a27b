#include "BTR/CommandRunner.hpp"
#include "BTR/Error.h"
#include <spdlog/spdlog.h>
#include <array>
#include <cstdio>
#include <memory>
#include <sys/wait.h>

namespace BTR {

std::string PopenCommandRunner::quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::expected<CommandResult, std::error_code> PopenCommandRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }

    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) {
            cmd += ' ';
        }
        cmd += quote(arg);
    }
    cmd += " 2>&1";

    spdlog::trace("PopenCommandRunner: {}", cmd);
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        spdlog::error("PopenCommandRunner: popen failed for {}", argv.front());
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }

    CommandResult result;
    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }
    // 127: the shell could not find the program
    if (result.exitCode == 127) {
        spdlog::error("PopenCommandRunner: {} not found", argv.front());
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }
    return result;
}

} // namespace BTR
