/**
 * @file AttributeLookup.cpp
 * @brief Lookup of ATA SMART attributes by ID with a name fallback
 */

#include "normalizers/AttributeLookup.hpp"

#include "normalizers/JsonFields.hpp"

namespace {

const nlohmann::json EMPTY_TABLE = nlohmann::json::array();

}  // namespace

AttributeLookup::AttributeLookup(const nlohmann::json& table)
    : table_(table.is_array() ? &table : &EMPTY_TABLE) {}

auto AttributeLookup::from_document(const nlohmann::json& document) -> AttributeLookup {
    const auto* table = json_fields::find(document, {"ata_smart_attributes", "table"});
    return AttributeLookup(table != nullptr ? *table : EMPTY_TABLE);
}

auto AttributeLookup::find(int id, std::string_view fallback_name) const
    -> const nlohmann::json* {
    const nlohmann::json* name_match = nullptr;

    for (const auto& row : *table_) {
        if (!row.is_object()) {
            continue;
        }
        if (auto row_id = json_fields::read_int(row, {"id"}); row_id && *row_id == id) {
            return &row;
        }
        if (name_match == nullptr && !fallback_name.empty()) {
            if (auto name = json_fields::read_string(row, {"name"}); name && *name == fallback_name) {
                name_match = &row;
            }
        }
    }

    return name_match;
}

auto AttributeLookup::value(int id, std::string_view fallback_name, AttributeField field) const
    -> std::optional<int64_t> {
    const auto* row = find(id, fallback_name);
    if (row == nullptr) {
        return std::nullopt;
    }

    switch (field) {
        case AttributeField::RAW:
            return json_fields::read_int(*row, {"raw", "value"});
        case AttributeField::NORMALIZED:
            return json_fields::read_int(*row, {"value"});
        case AttributeField::WORST:
            return json_fields::read_int(*row, {"worst"});
        case AttributeField::THRESHOLD:
            return json_fields::read_int(*row, {"thresh"});
    }
    return std::nullopt;
}

auto AttributeLookup::raw_string(int id, std::string_view fallback_name) const
    -> std::optional<std::string> {
    const auto* row = find(id, fallback_name);
    if (row == nullptr) {
        return std::nullopt;
    }
    return json_fields::read_string(*row, {"raw", "string"});
}

auto AttributeLookup::empty() const -> bool {
    return table_->empty();
}
