/**
 * @file ICommandExecutor.hpp
 * @brief Interface for running diagnostic binaries
 *
 * Discovery and normalization only depend on what a command printed, never
 * on how it was launched; this seam keeps them testable without hardware.
 */

#pragma once

#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <vector>

/**
 * @struct Command
 * @brief argv-style command line plus its time box
 */
struct Command {
    std::vector<std::string> argv;              ///< argv[0] is resolved through PATH
    std::chrono::milliseconds timeout{30'000};

    auto operator==(const Command&) const -> bool = default;
};

/**
 * @struct CommandResult
 * @brief What a finished command produced
 */
struct CommandResult {
    int exit_code = -1;                      ///< -1 if the child did not exit normally
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds duration{0};
};

/**
 * @class ICommandExecutor
 * @brief Abstract command runner
 */
class ICommandExecutor {
public:
    virtual ~ICommandExecutor() = default;

    /**
     * @brief Run @p command to completion or until its timeout
     * @return Result of the finished command, or an error with code
     *         SPAWN_FAILED or TIMED_OUT
     *
     * A non-zero exit code is not an error at this level.
     * Implementations must be safe to call from several threads.
     */
    [[nodiscard]] virtual auto execute(const Command& command)
        -> std::expected<CommandResult, util::Error> = 0;
};
