/**
 * @file SubprocessExecutor.cpp
 * @brief ICommandExecutor backed by GLib process spawning
 */

#include "services/SubprocessExecutor.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <string>
#include <thread>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr auto POLL_SLICE = std::chrono::milliseconds{100};
constexpr auto REAP_INTERVAL = std::chrono::milliseconds{10};

auto join_argv(const std::vector<std::string>& argv) -> std::string {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

auto remaining_ms(Clock::time_point deadline) -> int {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min(left, std::chrono::milliseconds{POLL_SLICE}).count());
}

/**
 * Read whatever is available; closes @p fd on EOF or a hard error
 */
void drain(util::FileDescriptor& fd, std::string& sink) {
    std::array<char, READ_CHUNK_SIZE> buffer{};
    while (fd.is_valid()) {
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
    }
}

void kill_and_reap(GPid pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    g_spawn_close_pid(pid);
}

}  // namespace

auto SubprocessExecutor::execute(const Command& command)
    -> std::expected<CommandResult, util::Error> {
    if (command.argv.empty()) {
        return std::unexpected(util::Error{"Empty command line", util::ErrorCode::INVALID_ARGUMENT});
    }

    const auto command_line = join_argv(command.argv);
    LOG_DEBUG("SubprocessExecutor", std::format("Running: {}", command_line));

    std::vector<gchar*> argv;
    argv.reserve(command.argv.size() + 1);
    for (const auto& arg : command.argv) {
        argv.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    gint stdout_raw = -1;
    gint stderr_raw = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    const auto started = Clock::now();
    const auto deadline = started + command.timeout;

    gboolean spawned = g_spawn_async_with_pipes(
        nullptr,           // working directory
        argv.data(),       // arguments
        nullptr,           // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD),
        nullptr,           // child setup
        nullptr,           // user data
        &child_pid,        // child PID
        nullptr,           // stdin
        &stdout_raw,       // stdout
        &stderr_raw,       // stderr
        &error
    );

    if (!spawned) {
        std::string message = std::format("Failed to spawn '{}': {}", command_line,
                                          error ? error->message : "Unknown error");
        if (error) {
            g_error_free(error);
        }
        LOG_WARNING("SubprocessExecutor", message);
        return std::unexpected(util::Error{std::move(message), util::ErrorCode::SPAWN_FAILED});
    }

    util::FileDescriptor stdout_fd(stdout_raw);
    util::FileDescriptor stderr_fd(stderr_raw);
    stdout_fd.set_nonblocking();
    stderr_fd.set_nonblocking();

    CommandResult result;

    auto timed_out = [&]() -> std::unexpected<util::Error> {
        kill_and_reap(child_pid);
        auto message = std::format("'{}' timed out after {} ms", command_line,
                                   command.timeout.count());
        LOG_WARNING("SubprocessExecutor", message);
        return std::unexpected(util::Error{std::move(message), util::ErrorCode::TIMED_OUT});
    };

    // Drain both pipes until the child closes them
    while (stdout_fd.is_valid() || stderr_fd.is_valid()) {
        if (Clock::now() >= deadline) {
            return timed_out();
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdout_fd.is_valid()) {
            fds[count++] = pollfd{.fd = stdout_fd.get(), .events = POLLIN, .revents = 0};
        }
        if (stderr_fd.is_valid()) {
            fds[count++] = pollfd{.fd = stderr_fd.get(), .events = POLLIN, .revents = 0};
        }

        int ready = ::poll(fds.data(), count, remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = std::format("poll() failed for '{}': {}", command_line,
                                       std::strerror(errno));
            kill_and_reap(child_pid);
            return std::unexpected(util::Error{std::move(message),
                                               util::ErrorCode::SPAWN_FAILED});
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (fds[i].fd == stdout_fd.get()) {
                drain(stdout_fd, result.stdout_data);
            } else if (fds[i].fd == stderr_fd.get()) {
                drain(stderr_fd, result.stderr_data);
            }
        }
    }

    // Pipes closed; wait for the exit status within the same deadline
    int wait_status = 0;
    while (true) {
        pid_t reaped = ::waitpid(child_pid, &wait_status, WNOHANG);
        if (reaped == child_pid) {
            break;
        }
        if (reaped < 0 && errno != EINTR) {
            auto message = std::format("waitpid() failed for '{}': {}", command_line,
                                       std::strerror(errno));
            g_spawn_close_pid(child_pid);
            return std::unexpected(util::Error{std::move(message),
                                               util::ErrorCode::SPAWN_FAILED});
        }
        if (Clock::now() >= deadline) {
            return timed_out();
        }
        std::this_thread::sleep_for(REAP_INTERVAL);
    }
    g_spawn_close_pid(child_pid);

    result.exit_code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    LOG_DEBUG("SubprocessExecutor",
              std::format("'{}' exited with {} after {} ms ({} bytes stdout)", command_line,
                          result.exit_code, result.duration.count(), result.stdout_data.size()));
    return result;
}
