/**
 * @file SubprocessExecutor.hpp
 * @brief ICommandExecutor backed by GLib process spawning
 */

#pragma once

#include "interfaces/ICommandExecutor.hpp"

/**
 * @class SubprocessExecutor
 * @brief Runs a command with captured stdout/stderr and a hard deadline
 *
 * The child is started with g_spawn_async_with_pipes (PATH lookup, no shell).
 * Both pipes are drained with poll() so a chatty stderr cannot block the
 * child. When the deadline passes the child receives SIGKILL and the call
 * returns a TIMED_OUT error. Stateless; safe to share between threads.
 */
class SubprocessExecutor : public ICommandExecutor {
public:
    SubprocessExecutor() = default;
    ~SubprocessExecutor() override = default;

    SubprocessExecutor(const SubprocessExecutor&) = delete;
    SubprocessExecutor& operator=(const SubprocessExecutor&) = delete;

    [[nodiscard]] auto execute(const Command& command)
        -> std::expected<CommandResult, util::Error> override;
};
