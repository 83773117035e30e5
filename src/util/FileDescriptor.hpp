/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Owns the pipe ends handed back by the subprocess spawner so that every
 * exit path of a probe closes them.
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { close_if_valid(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            close_if_valid();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and take ownership of @p fd
     */
    void reset(int fd = -1) noexcept {
        close_if_valid();
        fd_ = fd;
    }

    /**
     * @brief Give up ownership without closing
     * @return The raw descriptor, or -1
     */
    [[nodiscard]] auto release() noexcept -> int { return std::exchange(fd_, -1); }

    /**
     * @brief Switch the descriptor to O_NONBLOCK
     * @return false if fcntl failed
     */
    auto set_nonblocking() noexcept -> bool {
        if (!is_valid()) {
            return false;
        }
        int flags = ::fcntl(fd_, F_GETFL, 0);
        if (flags < 0) {
            return false;
        }
        return ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == 0;
    }

private:
    void close_if_valid() noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
    }

    int fd_ = -1;
};

}  // namespace util
