/**
 * @file Error.hpp
 * @brief Error value carried through std::expected
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorCode
 * @brief Failure categories reported by the scan pipeline
 */
enum class ErrorCode : int {
    NONE = 0,
    INVALID_ARGUMENT,    ///< Caller supplied a value outside the accepted range
    SPAWN_FAILED,        ///< Diagnostic binary could not be started
    TIMED_OUT,           ///< Command or device evaluation exceeded its deadline
    PARSE_FAILED,        ///< Tool output was empty or not the expected JSON shape
    DEVICE_OPEN_FAILED,  ///< Tool reported that the device could not be opened
    CANCELLED,           ///< Operator requested cancellation before the probe started
    SCAN_FAILED          ///< Device enumeration itself failed
};

/**
 * @brief Short stable name for an error code
 */
[[nodiscard]] constexpr auto error_code_name(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::NONE:
            return "none";
        case ErrorCode::INVALID_ARGUMENT:
            return "invalid_argument";
        case ErrorCode::SPAWN_FAILED:
            return "spawn_failed";
        case ErrorCode::TIMED_OUT:
            return "timed_out";
        case ErrorCode::PARSE_FAILED:
            return "parse_failed";
        case ErrorCode::DEVICE_OPEN_FAILED:
            return "device_open_failed";
        case ErrorCode::CANCELLED:
            return "cancelled";
        case ErrorCode::SCAN_FAILED:
            return "scan_failed";
    }
    return "unknown";
}

/**
 * @struct Error
 * @brief Represents an error with a message and a category code
 */
struct Error {
    std::string message;
    ErrorCode code = ErrorCode::NONE;

    Error() = default;
    explicit Error(std::string msg, ErrorCode err_code = ErrorCode::NONE)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    [[nodiscard]] auto is(ErrorCode other) const -> bool {
        return code == other;
    }
};

}  // namespace util
