/**
 * @file JsonFields.cpp
 * @brief Typed, non-throwing reads from smartctl JSON documents
 */

#include "normalizers/JsonFields.hpp"

#include <charconv>
#include <cmath>
#include <limits>

namespace json_fields {

namespace {

auto trim(std::string_view text) -> std::string_view {
    constexpr std::string_view WHITESPACE = " \t\r\n";
    auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

template<typename T>
auto parse_whole(std::string_view text) -> std::optional<T> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto find(const nlohmann::json& root, Path path) -> const nlohmann::json* {
    const nlohmann::json* node = &root;
    for (auto key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(std::string(key));
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

auto has(const nlohmann::json& root, Path path) -> bool {
    const auto* node = find(root, path);
    return node != nullptr && !node->is_null();
}

auto as_int(const nlohmann::json* node) -> std::optional<int64_t> {
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_number_unsigned()) {
        auto value = node->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (node->is_number_integer()) {
        return node->get<int64_t>();
    }
    if (node->is_number_float()) {
        auto value = node->get<double>();
        if (!std::isfinite(value) ||
            std::fabs(value) >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (node->is_string()) {
        return parse_whole<int64_t>(node->get_ref<const std::string&>());
    }
    return std::nullopt;
}

auto as_uint(const nlohmann::json* node) -> std::optional<uint64_t> {
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_number_unsigned()) {
        return node->get<uint64_t>();
    }
    if (node->is_string()) {
        return parse_whole<uint64_t>(node->get_ref<const std::string&>());
    }
    auto value = as_int(node);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

auto as_double(const nlohmann::json* node) -> std::optional<double> {
    if (node == nullptr) {
        return std::nullopt;
    }
    if (node->is_number()) {
        auto value = node->get<double>();
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }
    if (node->is_string()) {
        // smartctl prints SCSI gigabytes_processed as "1234.567"
        auto value = parse_whole<double>(node->get_ref<const std::string&>());
        if (value && !std::isfinite(*value)) {
            return std::nullopt;
        }
        return value;
    }
    return std::nullopt;
}

auto as_bool(const nlohmann::json* node) -> std::optional<bool> {
    if (node == nullptr || !node->is_boolean()) {
        return std::nullopt;
    }
    return node->get<bool>();
}

auto as_string(const nlohmann::json* node) -> std::optional<std::string> {
    if (node == nullptr || !node->is_string()) {
        return std::nullopt;
    }
    return std::string(trim(node->get_ref<const std::string&>()));
}

}  // namespace json_fields
