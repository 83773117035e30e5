/**
 * @file JsonFields.hpp
 * @brief Typed, non-throwing reads from smartctl JSON documents
 *
 * Every reader returns std::nullopt when a path segment is missing, the
 * value has the wrong type, or a numeric string does not parse. Callers
 * never see a json exception and never get a silent zero.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace json_fields {

using Path = std::initializer_list<std::string_view>;

/**
 * @brief Walk object keys from @p root
 * @return Pointer to the node, or nullptr if any key is missing
 */
[[nodiscard]] auto find(const nlohmann::json& root, Path path) -> const nlohmann::json*;

/**
 * @brief Whether @p path exists and is not null
 */
[[nodiscard]] auto has(const nlohmann::json& root, Path path) -> bool;

/**
 * @brief Interpret a node as a signed integer
 *
 * Accepts integers, finite floats (truncated) and numeric strings.
 */
[[nodiscard]] auto as_int(const nlohmann::json* node) -> std::optional<int64_t>;

/**
 * @brief Interpret a node as a non-negative integer
 */
[[nodiscard]] auto as_uint(const nlohmann::json* node) -> std::optional<uint64_t>;

/**
 * @brief Interpret a node as a floating point number
 */
[[nodiscard]] auto as_double(const nlohmann::json* node) -> std::optional<double>;

[[nodiscard]] auto as_bool(const nlohmann::json* node) -> std::optional<bool>;

/**
 * @brief Interpret a node as a string; trims surrounding whitespace
 */
[[nodiscard]] auto as_string(const nlohmann::json* node) -> std::optional<std::string>;

[[nodiscard]] inline auto read_int(const nlohmann::json& root, Path path)
    -> std::optional<int64_t> {
    return as_int(find(root, path));
}

[[nodiscard]] inline auto read_uint(const nlohmann::json& root, Path path)
    -> std::optional<uint64_t> {
    return as_uint(find(root, path));
}

[[nodiscard]] inline auto read_double(const nlohmann::json& root, Path path)
    -> std::optional<double> {
    return as_double(find(root, path));
}

[[nodiscard]] inline auto read_bool(const nlohmann::json& root, Path path)
    -> std::optional<bool> {
    return as_bool(find(root, path));
}

[[nodiscard]] inline auto read_string(const nlohmann::json& root, Path path)
    -> std::optional<std::string> {
    return as_string(find(root, path));
}

}  // namespace json_fields
