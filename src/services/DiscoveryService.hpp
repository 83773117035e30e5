/**
 * @file DiscoveryService.hpp
 * @brief smartctl-based device enumeration and telemetry probing
 */

#pragma once

#include "interfaces/ICommandExecutor.hpp"
#include "interfaces/IDiscoveryService.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @struct ScanEntry
 * @brief One element of `smartctl --scan-open --json` devices[]
 */
struct ScanEntry {
    std::string name;                       ///< Device path
    std::string type;                       ///< -d type smartctl chose
    std::string protocol;                   ///< "ATA", "NVMe", "SCSI" or empty
    std::optional<std::string> open_error;  ///< Set when smartctl could not open it

    auto operator==(const ScanEntry&) const -> bool = default;
};

/**
 * @class DiscoveryService
 * @brief Enumerates devices with smartctl and fetches their telemetry
 *
 * All process execution goes through the injected ICommandExecutor.
 *
 * smartctl exit status is a bitmask. Bit 0 (command line did not parse) and
 * bit 1 (device open failed) mean the document is unusable; the higher bits
 * describe drive health and are left to the grader.
 */
class DiscoveryService : public IDiscoveryService {
public:
    static constexpr int EXIT_BIT_COMMAND_LINE = 0x01;
    static constexpr int EXIT_BIT_OPEN_FAILED = 0x02;

    DiscoveryService(std::shared_ptr<ICommandExecutor> executor, DiscoveryOptions options = {});
    ~DiscoveryService() override = default;

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    [[nodiscard]] auto enumerate(const std::atomic<bool>& cancel_flag)
        -> std::expected<DiscoveryResult, util::Error> override;

    [[nodiscard]] auto probe(const DeviceCandidate& candidate)
        -> std::expected<RawTelemetry, util::Error> override;

    /**
     * @brief Parse scan output into entries
     * @return Entries in scan order; error if the output is not a JSON object
     */
    [[nodiscard]] static auto parse_scan_output(std::string_view output)
        -> std::expected<std::vector<ScanEntry>, util::Error>;

    /**
     * @brief Protocol from scan type and protocol strings
     *
     * USB bridge types (usb*, snt*) win over the protocol string; UNKNOWN
     * means a detection probe is needed.
     */
    [[nodiscard]] static auto classify(std::string_view type, std::string_view protocol)
        -> Protocol;

    /**
     * @brief Whether paths under this prefix are skipped (RAID pass-through)
     */
    [[nodiscard]] static auto is_skipped_path(std::string_view path) -> bool;

    [[nodiscard]] auto is_ignored(Protocol protocol) const -> bool;

    [[nodiscard]] auto options() const -> const DiscoveryOptions& { return options_; }

private:
    /**
     * @brief Run smartctl and parse its JSON output
     *
     * Applies the exit-bit and document checks shared by every call.
     */
    [[nodiscard]] auto run_smartctl(std::vector<std::string> args, const std::string& device,
                                    const std::string& device_type)
        -> std::expected<RawTelemetry, util::Error>;

    /**
     * @brief Ask smartctl which protocol @p path speaks
     */
    [[nodiscard]] auto detect_protocol(const std::string& path, const std::string& device_type)
        -> std::expected<Protocol, util::Error>;

    [[nodiscard]] auto scan_entries() -> std::expected<std::vector<ScanEntry>, util::Error>;

    std::shared_ptr<ICommandExecutor> executor_;
    DiscoveryOptions options_;
};
