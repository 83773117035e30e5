/**
 * @file DiscoveryService.cpp
 * @brief smartctl-based device enumeration and telemetry probing
 */

#include "services/DiscoveryService.hpp"

#include "normalizers/JsonFields.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace {

constexpr std::string_view COMPONENT = "Discovery";
constexpr std::string_view RAID_BUS_PREFIX = "/dev/bus/";

/**
 * First diagnostic line smartctl put into its JSON (smartctl.messages[])
 */
auto smartctl_message(const nlohmann::json& document) -> std::optional<std::string> {
    const auto* messages = json_fields::find(document, {"smartctl", "messages"});
    if (messages == nullptr || !messages->is_array() || messages->empty()) {
        return std::nullopt;
    }
    return json_fields::read_string(messages->front(), {"string"});
}

}  // namespace

DiscoveryService::DiscoveryService(std::shared_ptr<ICommandExecutor> executor,
                                   DiscoveryOptions options)
    : executor_(std::move(executor)), options_(std::move(options)) {}

auto DiscoveryService::is_skipped_path(std::string_view path) -> bool {
    return path.starts_with(RAID_BUS_PREFIX);
}

auto DiscoveryService::is_ignored(Protocol protocol) const -> bool {
    switch (protocol) {
        case Protocol::ATA:
            return options_.ignore_ata;
        case Protocol::NVME:
            return options_.ignore_nvme;
        case Protocol::SCSI:
            return options_.ignore_scsi;
        case Protocol::USB:
            return options_.ignore_usb;
        case Protocol::UNKNOWN:
            return false;
    }
    return false;
}

auto DiscoveryService::classify(std::string_view type, std::string_view protocol) -> Protocol {
    if (type.starts_with("usb") || type.starts_with("snt")) {
        return Protocol::USB;
    }
    if (auto parsed = protocol_from_string(protocol); parsed != Protocol::UNKNOWN) {
        return parsed;
    }
    if (type == "nvme") {
        return Protocol::NVME;
    }
    if (type == "ata" || type == "sat") {
        return Protocol::ATA;
    }
    if (type == "scsi") {
        return Protocol::SCSI;
    }
    return Protocol::UNKNOWN;
}

auto DiscoveryService::parse_scan_output(std::string_view output)
    -> std::expected<std::vector<ScanEntry>, util::Error> {
    auto document = nlohmann::json::parse(output, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::unexpected(
            util::Error{"Scan output is not a JSON object", util::ErrorCode::PARSE_FAILED});
    }

    std::vector<ScanEntry> entries;
    const auto* devices = json_fields::find(document, {"devices"});
    if (devices == nullptr || !devices->is_array()) {
        return entries;
    }

    for (const auto& device : *devices) {
        auto name = json_fields::read_string(device, {"name"});
        if (!name || name->empty()) {
            continue;
        }
        entries.push_back(ScanEntry{
            .name = std::move(*name),
            .type = json_fields::read_string(device, {"type"}).value_or(""),
            .protocol = json_fields::read_string(device, {"protocol"}).value_or(""),
            .open_error = json_fields::read_string(device, {"open_error"}),
        });
    }
    return entries;
}

auto DiscoveryService::scan_entries() -> std::expected<std::vector<ScanEntry>, util::Error> {
    if (!options_.explicit_devices.empty()) {
        std::vector<ScanEntry> entries;
        entries.reserve(options_.explicit_devices.size());
        for (const auto& path : options_.explicit_devices) {
            entries.push_back(ScanEntry{.name = path});
        }
        return entries;
    }

    Command command{.argv = {options_.smartctl_path, "--scan-open", "--json"},
                    .timeout = options_.command_timeout};
    auto result = executor_->execute(command);
    if (!result) {
        return std::unexpected(util::Error{
            std::format("Device scan failed: {}", result.error().message),
            util::ErrorCode::SCAN_FAILED});
    }
    if ((result->exit_code & EXIT_BIT_COMMAND_LINE) != 0) {
        return std::unexpected(util::Error{
            std::format("Device scan rejected by smartctl (exit {})", result->exit_code),
            util::ErrorCode::SCAN_FAILED});
    }

    auto entries = parse_scan_output(result->stdout_data);
    if (!entries) {
        return std::unexpected(util::Error{
            std::format("Device scan failed: {}", entries.error().message),
            util::ErrorCode::SCAN_FAILED});
    }
    return entries;
}

auto DiscoveryService::enumerate(const std::atomic<bool>& cancel_flag)
    -> std::expected<DiscoveryResult, util::Error> {
    auto entries = scan_entries();
    if (!entries) {
        LOG_ERROR(COMPONENT, entries.error().message);
        return std::unexpected(entries.error());
    }

    DiscoveryResult discovered;
    size_t order = 0;

    for (const auto& entry : *entries) {
        if (is_skipped_path(entry.name)) {
            LOG_DEBUG(COMPONENT, std::format("Skipping RAID pass-through device {}", entry.name));
            continue;
        }

        auto protocol = classify(entry.type, entry.protocol);

        if (entry.open_error) {
            if (is_ignored(protocol)) {
                continue;
            }
            LOG_WARNING(COMPONENT, std::format("Cannot open {}: {}", entry.name, *entry.open_error));
            discovered.failures.push_back(DiscoveryFailure{
                .order = order++,
                .path = entry.name,
                .device_type = entry.type,
                .protocol = protocol,
                .error = util::Error{*entry.open_error, util::ErrorCode::DEVICE_OPEN_FAILED}});
            continue;
        }

        if (protocol == Protocol::UNKNOWN && cancel_flag.load()) {
            discovered.failures.push_back(DiscoveryFailure{
                .order = order++,
                .path = entry.name,
                .device_type = entry.type,
                .protocol = protocol,
                .error = util::Error{"Scan cancelled before protocol detection",
                                     util::ErrorCode::CANCELLED}});
            continue;
        }

        if (protocol == Protocol::UNKNOWN) {
            auto detected = detect_protocol(entry.name, entry.type);
            if (!detected) {
                LOG_WARNING(COMPONENT, std::format("Protocol detection failed for {}: {}",
                                                   entry.name, detected.error().message));
                discovered.failures.push_back(DiscoveryFailure{.order = order++,
                                                               .path = entry.name,
                                                               .device_type = entry.type,
                                                               .protocol = protocol,
                                                               .error = detected.error()});
                continue;
            }
            protocol = *detected;
        }

        if (is_ignored(protocol)) {
            LOG_DEBUG(COMPONENT, std::format("Ignoring {} device {}", protocol_to_string(protocol),
                                             entry.name));
            continue;
        }

        discovered.devices.push_back(DeviceCandidate{.order = order++,
                                                     .path = entry.name,
                                                     .device_type = entry.type,
                                                     .protocol = protocol});
    }

    LOG_INFO(COMPONENT, std::format("Discovered {} device(s), {} unreachable",
                                    discovered.devices.size(), discovered.failures.size()));
    return discovered;
}

auto DiscoveryService::run_smartctl(std::vector<std::string> args, const std::string& device,
                                    const std::string& device_type)
    -> std::expected<RawTelemetry, util::Error> {
    Command command;
    command.timeout = options_.command_timeout;
    command.argv.push_back(options_.smartctl_path);
    std::ranges::move(args, std::back_inserter(command.argv));
    if (!device_type.empty()) {
        command.argv.push_back("-d");
        command.argv.push_back(device_type);
    }
    command.argv.push_back(device);

    auto result = executor_->execute(command);
    if (!result) {
        return std::unexpected(result.error());
    }

    auto document = nlohmann::json::parse(result->stdout_data, nullptr, false);
    const bool parsed = !document.is_discarded() && document.is_object();

    if ((result->exit_code & EXIT_BIT_COMMAND_LINE) != 0) {
        return std::unexpected(util::Error{
            std::format("smartctl rejected the command line for {} (exit {})", device,
                        result->exit_code),
            util::ErrorCode::INVALID_ARGUMENT});
    }
    if ((result->exit_code & EXIT_BIT_OPEN_FAILED) != 0) {
        auto reason = parsed ? smartctl_message(document) : std::nullopt;
        return std::unexpected(util::Error{
            std::format("Failed to open {}: {}", device, reason.value_or("device open failed")),
            util::ErrorCode::DEVICE_OPEN_FAILED});
    }
    if (result->stdout_data.empty()) {
        return std::unexpected(util::Error{std::format("smartctl printed nothing for {}", device),
                                           util::ErrorCode::PARSE_FAILED});
    }
    if (!parsed) {
        return std::unexpected(util::Error{
            std::format("smartctl output for {} is not a JSON object", device),
            util::ErrorCode::PARSE_FAILED});
    }

    return RawTelemetry{.document = std::move(document),
                        .exit_status = result->exit_code,
                        .probe_duration = result->duration};
}

auto DiscoveryService::detect_protocol(const std::string& path, const std::string& device_type)
    -> std::expected<Protocol, util::Error> {
    auto info = run_smartctl({"--info", "--json"}, path, device_type);
    if (!info) {
        return std::unexpected(info.error());
    }

    auto type = json_fields::read_string(info->document, {"device", "type"}).value_or("");
    auto protocol = json_fields::read_string(info->document, {"device", "protocol"}).value_or("");
    auto detected = classify(type, protocol);

    LOG_DEBUG(COMPONENT, std::format("Detected {} as {} (type '{}', protocol '{}')", path,
                                     protocol_to_string(detected), type, protocol));
    return detected;
}

auto DiscoveryService::probe(const DeviceCandidate& candidate)
    -> std::expected<RawTelemetry, util::Error> {
    auto telemetry = run_smartctl({"--xall", "--json"}, candidate.path, candidate.device_type);
    if (!telemetry) {
        LOG_WARNING(COMPONENT, std::format("Probe failed for {}: {}", candidate.path,
                                           telemetry.error().message));
        return telemetry;
    }

    LOG_DEBUG(COMPONENT, std::format("Probed {} in {} ms (exit {})", candidate.path,
                                     telemetry->probe_duration.count(), telemetry->exit_status));
    return telemetry;
}
