/**
 * @file AttributeLookup.hpp
 * @brief Lookup of ATA SMART attributes by ID with a name fallback
 *
 * Vendors reuse IDs and rename attributes freely, so every extraction asks
 * for a numeric ID first and only falls back to the attribute name when no
 * row carries that ID.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @enum AttributeField
 * @brief Which column of an attribute row to read
 */
enum class AttributeField {
    RAW,         ///< raw.value
    NORMALIZED,  ///< value
    WORST,       ///< worst
    THRESHOLD    ///< thresh
};

/**
 * @class AttributeLookup
 * @brief Read-only view over `ata_smart_attributes.table`
 *
 * Holds a pointer into the document; the document must outlive the lookup.
 */
class AttributeLookup {
public:
    /// Pass as the ID to resolve by name only
    static constexpr int NAME_ONLY = -1;

    /**
     * @param table The attribute array; anything that is not an array is
     *              treated as an empty table
     */
    explicit AttributeLookup(const nlohmann::json& table);

    /**
     * @brief Build a lookup over `ata_smart_attributes.table` of @p document
     */
    [[nodiscard]] static auto from_document(const nlohmann::json& document) -> AttributeLookup;

    /**
     * @brief Find the row for @p id, falling back to @p fallback_name
     * @return The row, or nullptr if neither matched
     *
     * One pass over the table: an ID match returns immediately, the first
     * name match is remembered and returned only if no ID matched.
     */
    [[nodiscard]] auto find(int id, std::string_view fallback_name = {}) const
        -> const nlohmann::json*;

    /**
     * @brief Read one numeric column of the resolved row
     * @return The value, or nullopt if the row or the column is missing
     */
    [[nodiscard]] auto value(int id, std::string_view fallback_name,
                             AttributeField field = AttributeField::RAW) const
        -> std::optional<int64_t>;

    /**
     * @brief raw.string of the resolved row (e.g. "30 (Min/Max 25/40)")
     */
    [[nodiscard]] auto raw_string(int id, std::string_view fallback_name = {}) const
        -> std::optional<std::string>;

    [[nodiscard]] auto empty() const -> bool;

private:
    const nlohmann::json* table_;
};
