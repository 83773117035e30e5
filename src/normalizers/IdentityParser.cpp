/**
 * @file IdentityParser.cpp
 * @brief Builds DeviceIdentity from a telemetry document
 */

#include "normalizers/IdentityParser.hpp"

#include "normalizers/JsonFields.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

struct Brand {
    std::string_view word;     ///< Upper-case word as it appears in model numbers
    std::string_view display;  ///< Vendor name reported to the operator
};

constexpr std::array KNOWN_BRANDS = {
    Brand{"2-POWER", "2-Power"},
    Brand{"ADATA", "ADATA"},
    Brand{"CORSAIR", "Corsair"},
    Brand{"CRUCIAL", "Crucial"},
    Brand{"DELL", "Dell"},
    Brand{"EMC", "EMC"},
    Brand{"FUJITSU", "Fujitsu"},
    Brand{"GIGABYTE", "Gigabyte"},
    Brand{"HGST", "HGST"},
    Brand{"HITACHI", "Hitachi"},
    Brand{"HP", "HP"},
    Brand{"HPE", "HPE"},
    Brand{"IBM", "IBM"},
    Brand{"IBM-ESXS", "IBM"},
    Brand{"INTEL", "Intel"},
    Brand{"INTENSO", "Intenso"},
    Brand{"KINGFAST", "KingFast"},
    Brand{"KINGSTON", "Kingston"},
    Brand{"KIOXIA", "Kioxia"},
    Brand{"LENOVO-X", "Lenovo"},
    Brand{"LEXAR", "Lexar"},
    Brand{"LITEON", "Liteon"},
    Brand{"MAXTOR", "Maxtor"},
    Brand{"MICRON", "Micron"},
    Brand{"NETAPP", "NetApp"},
    Brand{"PATRIOT", "Patriot"},
    Brand{"PIONEER", "Pioneer"},
    Brand{"PLEXTOR", "Plextor"},
    Brand{"PLIANT", "Pliant"},
    Brand{"PNY", "PNY"},
    Brand{"SAMSUNG", "Samsung"},
    Brand{"SANDISK", "SanDisk"},
    Brand{"SEAGATE", "Seagate"},
    Brand{"SKHYNIX", "SK hynix"},
    Brand{"SMI", "SMI"},
    Brand{"SONY", "Sony"},
    Brand{"SPCC", "SPCC"},
    Brand{"SUPERTALENT", "SuperTalent"},
    Brand{"TOSHIBA", "Toshiba"},
    Brand{"TRANSCEND", "Transcend"},
    Brand{"WD", "Western Digital"},
    Brand{"WDC", "Western Digital"},
    Brand{"WESTERNDIGITAL", "Western Digital"},
};

auto to_upper(std::string_view text) -> std::string {
    std::string upper(text);
    std::ranges::transform(upper, upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

auto is_digit_at(std::string_view text, size_t index) -> bool {
    return index < text.size() && std::isdigit(static_cast<unsigned char>(text[index])) != 0;
}

auto first_word(std::string_view text) -> std::string_view {
    auto end = text.find_first_of(" _");
    return text.substr(0, end);
}

/**
 * Model number families that never carry the brand word
 */
auto vendor_from_prefix(std::string_view model) -> std::optional<std::string> {
    // HPE: MB/MK/MM followed by three digits (MB2000GCWDA, MM1000GBKAL)
    for (std::string_view prefix : {"MB", "MK", "MM"}) {
        if (model.starts_with(prefix) && is_digit_at(model, 2) && is_digit_at(model, 3) &&
            is_digit_at(model, 4)) {
            return "HPE";
        }
    }
    if (model.starts_with("HUS") && is_digit_at(model, 3)) {
        return "HGST";
    }
    if (model.starts_with("SSDS")) {
        return "Intel";
    }
    for (std::string_view prefix : {"MZ-", "MZ7", "MZV"}) {
        if (model.starts_with(prefix)) {
            return "Samsung";
        }
    }
    if (model.starts_with("ST") && is_digit_at(model, 2)) {
        return "Seagate";
    }
    if (model.starts_with("THN")) {
        return "Toshiba";
    }
    if (model.starts_with("WDC-") || (model.starts_with("WD") && is_digit_at(model, 2))) {
        return "Western Digital";
    }
    return std::nullopt;
}

auto media_type(Protocol protocol, const nlohmann::json& document) -> MediaType {
    if (protocol == Protocol::NVME) {
        return MediaType::SSD;
    }
    auto rotation = json_fields::read_int(document, {"rotation_rate"});
    if (!rotation) {
        return MediaType::UNKNOWN;
    }
    return *rotation == 0 ? MediaType::SSD : MediaType::HDD;
}

}  // namespace

auto IdentityParser::from_candidate(const DeviceCandidate& candidate) -> DeviceIdentity {
    return DeviceIdentity{.path = candidate.path,
                          .protocol = candidate.protocol,
                          .device_type = candidate.device_type};
}

auto IdentityParser::parse(const DeviceCandidate& candidate, const nlohmann::json& document)
    -> DeviceIdentity {
    auto identity = from_candidate(candidate);

    std::string raw_model;
    std::optional<std::string> reported_vendor;

    if (json_fields::has(document, {"scsi_vendor"}) ||
        json_fields::has(document, {"scsi_product"}) ||
        json_fields::has(document, {"scsi_model_name"})) {
        reported_vendor = json_fields::read_string(document, {"scsi_vendor"});
        raw_model = json_fields::read_string(document, {"scsi_product"})
                        .or_else([&] {
                            return json_fields::read_string(document, {"scsi_model_name"});
                        })
                        .value_or("");
        identity.firmware = json_fields::read_string(document, {"scsi_revision"}).value_or("");
    } else {
        reported_vendor = json_fields::read_string(document, {"vendor"});
        raw_model = json_fields::read_string(document, {"model_name"}).value_or("");
        identity.firmware = json_fields::read_string(document, {"firmware_version"}).value_or("");
    }

    identity.serial = json_fields::read_string(document, {"serial_number"}).value_or("");
    identity.capacity_bytes = json_fields::read_uint(document, {"user_capacity", "bytes"});
    identity.media_type = media_type(candidate.protocol, document);

    if (reported_vendor && !reported_vendor->empty()) {
        identity.vendor = canonical_brand(*reported_vendor).value_or(*reported_vendor);
    } else {
        // smartctl's drive database family, e.g. "Toshiba 2.5\" HDD MQ01ABD..."
        auto family = json_fields::read_string(document, {"model_family"}).value_or("");
        identity.vendor = vendor_from_model(family)
                              .or_else([&] { return vendor_from_model(raw_model); })
                              .value_or(family);
    }
    identity.model = strip_brand(raw_model);

    return identity;
}

auto IdentityParser::canonical_brand(std::string_view word) -> std::optional<std::string> {
    auto upper = to_upper(word);
    auto it = std::ranges::find(KNOWN_BRANDS, std::string_view(upper), &Brand::word);
    if (it == KNOWN_BRANDS.end()) {
        return std::nullopt;
    }
    return std::string(it->display);
}

auto IdentityParser::vendor_from_model(std::string_view model) -> std::optional<std::string> {
    auto rest = model;
    while (!rest.empty()) {
        auto word = first_word(rest);
        if (auto brand = canonical_brand(word)) {
            return brand;
        }
        rest.remove_prefix(std::min(word.size() + 1, rest.size()));
    }
    return vendor_from_prefix(model);
}

auto IdentityParser::strip_brand(std::string_view model) -> std::string {
    auto word = first_word(model);
    if (word.size() == model.size() || !canonical_brand(word)) {
        return std::string(model);
    }
    return std::string(model.substr(word.size() + 1));
}
