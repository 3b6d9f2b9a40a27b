#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace BTR {

struct CommandResult {
    int exitCode = 0;
    std::string output;     ///< Captured stdout (stderr is merged in)
};

/**
 * @brief Runs helper programs (bluetoothctl) and captures their output
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @param argv Program followed by its arguments
     * @return Exit code and output, or PlatformError::CommandFailed if the
     *         process could not be started
     */
    virtual std::expected<CommandResult, std::error_code> run(const std::vector<std::string>& argv) = 0;
};

/**
 * @brief popen(3) based runner; arguments are shell-quoted
 */
class PopenCommandRunner : public ICommandRunner {
public:
    std::expected<CommandResult, std::error_code> run(const std::vector<std::string>& argv) override;

    static std::string quote(const std::string& arg);
};

} // namespace BTR
