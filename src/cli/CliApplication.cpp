/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "models/JsonSerialization.hpp"
#include "services/DiscoveryService.hpp"
#include "services/SubprocessExecutor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

// Application name
constexpr auto APP_NAME = "storage-grader";

// Upper bound for --timeout (one day)
constexpr int64_t MAX_TIMEOUT_SECONDS = 86'400;

// Long-only option codes
enum LongOption : int {
    OPT_IGNORE_ATA = 256,
    OPT_IGNORE_NVME,
    OPT_IGNORE_SCSI,
    OPT_IGNORE_USB,
    OPT_SMARTCTL,
    OPT_DEBUG,
    OPT_MAX_PENDING,
    OPT_MAX_REALLOCATED,
    OPT_MAX_UNCORRECTABLE,
    OPT_MAX_PERCENT_USED,
    OPT_MIN_SPARE,
    OPT_MAX_WORKLOAD,
    OPT_MAX_WARNING_TEMP,
    OPT_MAX_CRITICAL_TEMP
};

// Command line options
const struct option long_options[] = {
    {             "help",       no_argument, nullptr,                     'h'},
    {          "version",       no_argument, nullptr,                     'V'},
    {             "json",       no_argument, nullptr,                     'j'},
    {            "quiet",       no_argument, nullptr,                     'q'},
    {           "device", required_argument, nullptr,                     'd'},
    {          "workers", required_argument, nullptr,                     'w'},
    {          "timeout", required_argument, nullptr,                     't'},
    {       "ignore-ata",       no_argument, nullptr,          OPT_IGNORE_ATA},
    {      "ignore-nvme",       no_argument, nullptr,         OPT_IGNORE_NVME},
    {      "ignore-scsi",       no_argument, nullptr,         OPT_IGNORE_SCSI},
    {       "ignore-usb",       no_argument, nullptr,          OPT_IGNORE_USB},
    {         "smartctl", required_argument, nullptr,            OPT_SMARTCTL},
    {            "debug",       no_argument, nullptr,               OPT_DEBUG},
    {      "max-pending", required_argument, nullptr,         OPT_MAX_PENDING},
    {  "max-reallocated", required_argument, nullptr,     OPT_MAX_REALLOCATED},
    {"max-uncorrectable", required_argument, nullptr,   OPT_MAX_UNCORRECTABLE},
    { "max-percent-used", required_argument, nullptr,    OPT_MAX_PERCENT_USED},
    {        "min-spare", required_argument, nullptr,           OPT_MIN_SPARE},
    {     "max-workload", required_argument, nullptr,        OPT_MAX_WORKLOAD},
    { "max-warning-temp", required_argument, nullptr,    OPT_MAX_WARNING_TEMP},
    {"max-critical-temp", required_argument, nullptr,   OPT_MAX_CRITICAL_TEMP},
    {            nullptr,                 0, nullptr,                       0}
};

auto option_name(int code) -> std::string_view {
    for (const auto& opt : long_options) {
        if (opt.name != nullptr && opt.val == code) {
            return opt.name;
        }
    }
    return "?";
}

template<typename T>
auto parse_number(int code, std::string_view text) -> std::expected<T, util::Error> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < T{}) {
        return std::unexpected(util::Error{
            std::format("Invalid value for --{}: '{}'", option_name(code), text),
            util::ErrorCode::INVALID_ARGUMENT});
    }
    return value;
}

auto format_workload(const std::optional<double>& workload) -> std::string {
    if (!workload) {
        return "-";
    }
    return std::format("{:.1f}", *workload);
}

auto reason_text(const GradeResult& grade) -> std::string {
    if (grade.failure_reason) {
        return std::string(failure_reason_to_string(*grade.failure_reason));
    }
    if (grade.flag_reason) {
        return std::string(flag_reason_to_string(*grade.flag_reason));
    }
    return "-";
}

auto truncate(std::string text, size_t width) -> std::string {
    if (text.length() > width - 2) {
        text = text.substr(0, width - 5) + "...";
    }
    return text;
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().message << "\n"
                  << "Run with --help for usage.\n";
        return EXIT_USAGE_OR_SCAN_ERROR;
    }
    const auto& options = *parsed;

    if (options.show_help) {
        print_help();
        return EXIT_ALL_PASSED;
    }

    if (options.show_version) {
        print_version();
        return EXIT_ALL_PASSED;
    }

    init_logging(options);

    try {
        return cmd_scan(options);
    } catch (const std::exception& e) {
        LOG_ERROR("CLI", std::format("Scan aborted: {}", e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE_OR_SCAN_ERROR;
    }
}

void CliApplication::init_logging(const CliOptions& options) {
    auto level = util::LogLevel::INFO;
    if (options.debug) {
        level = util::LogLevel::DEBUG;
    } else if (options.quiet) {
        level = util::LogLevel::WARNING;
    }

    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "storage-grader" / "logs";
    auto& logger = util::Logger::instance();
    auto initialized = logger.initialize({.log_dir = log_dir,
                                          .app_name = APP_NAME,
                                          .min_level = level,
                                          .console_output = options.debug});
    if (!initialized && !options.quiet) {
        std::cerr << "Warning: " << initialized.error().message << "\n";
    }
}

auto CliApplication::parse_args(int argc, char* argv[]) -> std::expected<CliOptions, util::Error> {
    CliOptions options;

    // Reset getopt state so repeated calls parse from the start
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVjqd:w:t:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'd':
                options.discovery.explicit_devices.emplace_back(optarg);
                break;
            case 'w': {
                auto workers = parse_number<size_t>(opt, optarg);
                if (!workers || *workers == 0) {
                    return std::unexpected(util::Error{
                        std::format("Invalid value for --workers: '{}'", optarg),
                        util::ErrorCode::INVALID_ARGUMENT});
                }
                options.scan.worker_count = *workers;
                break;
            }
            case 't': {
                auto seconds = parse_number<int64_t>(opt, optarg);
                if (!seconds || *seconds == 0 || *seconds > MAX_TIMEOUT_SECONDS) {
                    return std::unexpected(util::Error{
                        std::format("Invalid value for --timeout: '{}'", optarg),
                        util::ErrorCode::INVALID_ARGUMENT});
                }
                options.scan.device_timeout = std::chrono::seconds{*seconds};
                options.discovery.command_timeout = std::chrono::seconds{*seconds};
                break;
            }
            case OPT_IGNORE_ATA:
                options.discovery.ignore_ata = true;
                break;
            case OPT_IGNORE_NVME:
                options.discovery.ignore_nvme = true;
                break;
            case OPT_IGNORE_SCSI:
                options.discovery.ignore_scsi = true;
                break;
            case OPT_IGNORE_USB:
                options.discovery.ignore_usb = true;
                break;
            case OPT_SMARTCTL:
                options.discovery.smartctl_path = optarg;
                break;
            case OPT_DEBUG:
                options.debug = true;
                break;
            case OPT_MAX_WORKLOAD: {
                auto value = parse_number<double>(opt, optarg);
                if (!value) {
                    return std::unexpected(value.error());
                }
                options.limits.workload_tb_per_year_max = *value;
                break;
            }
            case OPT_MAX_PENDING:
            case OPT_MAX_REALLOCATED:
            case OPT_MAX_UNCORRECTABLE:
            case OPT_MAX_PERCENT_USED:
            case OPT_MIN_SPARE:
            case OPT_MAX_WARNING_TEMP:
            case OPT_MAX_CRITICAL_TEMP: {
                auto value = parse_number<int64_t>(opt, optarg);
                if (!value) {
                    return std::unexpected(value.error());
                }
                switch (opt) {
                    case OPT_MAX_PENDING:
                        options.limits.pending_sectors_max = *value;
                        break;
                    case OPT_MAX_REALLOCATED:
                        options.limits.reallocated_sectors_max = *value;
                        break;
                    case OPT_MAX_UNCORRECTABLE:
                        options.limits.uncorrectable_errors_max = *value;
                        break;
                    case OPT_MAX_PERCENT_USED:
                        options.limits.percent_used_max = *value;
                        break;
                    case OPT_MIN_SPARE:
                        options.limits.available_spare_min = *value;
                        break;
                    case OPT_MAX_WARNING_TEMP:
                        options.limits.warning_temp_minutes_max = *value;
                        break;
                    default:
                        options.limits.critical_temp_minutes_max = *value;
                        break;
                }
                break;
            }
            default:
                return std::unexpected(util::Error{
                    std::format("Unknown or incomplete option '{}'",
                                optind > 0 && optind <= argc ? argv[optind - 1] : "?"),
                    util::ErrorCode::INVALID_ARGUMENT});
        }
    }

    if (optind < argc) {
        return std::unexpected(util::Error{std::format("Unexpected argument '{}'", argv[optind]),
                                           util::ErrorCode::INVALID_ARGUMENT});
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Grade the health of every reachable drive from its SMART telemetry\n\n"
              << "Options:\n"
              << "  -h, --help                  Show this help message\n"
              << "  -V, --version               Show version information\n"
              << "  -j, --json                  Print results as JSON\n"
              << "  -q, --quiet                 Only log warnings and errors\n"
              << "      --debug                 Verbose logging, mirrored to stderr\n"
              << "  -d, --device <path>         Grade this device instead of scanning (repeatable)\n"
              << "  -w, --workers <n>           Parallel probes (default: max(4, CPUs))\n"
              << "  -t, --timeout <seconds>     Per-device time limit, 1-86400 (default: 30)\n"
              << "      --smartctl <path>       smartctl binary (default: smartctl)\n"
              << "      --ignore-ata            Skip ATA/SATA devices\n"
              << "      --ignore-nvme           Skip NVMe devices\n"
              << "      --ignore-scsi           Skip SCSI/SAS devices\n"
              << "      --ignore-usb            Skip USB-attached devices\n\n"
              << "Thresholds:\n"
              << "      --max-pending <n>       Pending sectors allowed (default: 10)\n"
              << "      --max-reallocated <n>   Reallocated sectors allowed (default: 10)\n"
              << "      --max-uncorrectable <n> NVMe media errors allowed (default: 10)\n"
              << "      --max-percent-used <n>  Endurance used allowed (default: 100)\n"
              << "      --min-spare <n>         Spare at or below this fails (default: 97)\n"
              << "      --max-workload <tb>     TB/year before HeavyUse flag (default: 550)\n"
              << "      --max-warning-temp <m>  Warning-temp minutes before flag (default: 60)\n"
              << "      --max-critical-temp <m> Critical-temp minutes allowed (default: 0)\n\n"
              << "Exit status:\n"
              << "  0  every device passed (flagged devices included)\n"
              << "  1  usage error or the device scan failed\n"
              << "  2  at least one device failed or could not be read\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << "\n"
              << "  " << APP_NAME << " --json --ignore-usb\n"
              << "  " << APP_NAME << " --device /dev/sda --device /dev/nvme0 --min-spare 90\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Drive health grading for ATA, NVMe and SCSI devices\n";
}

auto CliApplication::cmd_scan(const CliOptions& options) -> int {
    std::optional<ThresholdPolicy> policy;
    try {
        policy.emplace(options.limits);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("CLI", std::format("Invalid thresholds: {}", e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE_OR_SCAN_ERROR;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto executor = std::make_shared<SubprocessExecutor>();
    auto discovery = std::make_shared<DiscoveryService>(executor, options.discovery);
    HealthScanService service(discovery, *policy, options.scan);

    auto results = service.scan(g_cancel_requested);
    if (!results) {
        LOG_ERROR("CLI", results.error().message);
        std::cerr << "Error: " << results.error().message << "\n";
        return EXIT_USAGE_OR_SCAN_ERROR;
    }

    if (g_cancel_requested.load()) {
        LOG_WARNING("CLI", "Scan was cancelled; unprobed devices are reported as errors");
        std::cerr << "Cancelled: devices not yet probed are reported as errors.\n";
    }

    if (options.json_output) {
        print_json(*results, std::cout);
    } else {
        print_table(*results, std::cout);
    }

    return exit_code_for(*results);
}

void CliApplication::print_json(const std::vector<GradedDevice>& devices, std::ostream& out) {
    // Device paths come from argv and may not be valid UTF-8
    out << graded_devices_to_json(devices).dump(2, ' ', false,
                                                 nlohmann::json::error_handler_t::replace)
        << "\n";
}

void CliApplication::print_table(const std::vector<GradedDevice>& devices, std::ostream& out) {
    if (devices.empty()) {
        out << "No devices found.\n";
        return;
    }

    // Column widths for table formatting
    constexpr int COL_PATH = 16;
    constexpr int COL_PROTOCOL = 9;
    constexpr int COL_MODEL = 28;
    constexpr int COL_SERIAL = 22;
    constexpr int COL_STATUS = 8;
    constexpr int COL_REASON = 20;
    constexpr int COL_WORKLOAD = 12;

    out << std::left << std::setw(COL_PATH) << "DEVICE" << std::setw(COL_PROTOCOL) << "PROTOCOL"
        << std::setw(COL_MODEL) << "MODEL" << std::setw(COL_SERIAL) << "SERIAL"
        << std::setw(COL_STATUS) << "STATUS" << std::setw(COL_REASON) << "REASON"
        << std::setw(COL_WORKLOAD) << "TB/YEAR" << "\n";
    out << std::string(COL_PATH + COL_PROTOCOL + COL_MODEL + COL_SERIAL + COL_STATUS + COL_REASON +
                           COL_WORKLOAD,
                       '-')
        << "\n";

    for (const auto& device : devices) {
        const auto& identity = device.identity;
        auto model = identity.vendor.empty() ? identity.model
                                             : std::format("{} {}", identity.vendor, identity.model);

        out << std::left << std::setw(COL_PATH) << truncate(identity.path, COL_PATH)
            << std::setw(COL_PROTOCOL) << protocol_to_string(identity.protocol)
            << std::setw(COL_MODEL) << truncate(model, COL_MODEL) << std::setw(COL_SERIAL)
            << truncate(identity.serial, COL_SERIAL) << std::setw(COL_STATUS)
            << grade_status_to_string(device.grade.status) << std::setw(COL_REASON)
            << reason_text(device.grade) << std::setw(COL_WORKLOAD)
            << format_workload(device.grade.workload_tb_per_year) << "\n";
    }

    auto passed = std::ranges::count_if(devices, [](const GradedDevice& d) {
        return d.grade.is_pass();
    });
    out << "\n" << passed << " of " << devices.size() << " device(s) passed\n";
}

auto CliApplication::exit_code_for(const std::vector<GradedDevice>& devices) -> int {
    bool all_passed = std::ranges::all_of(devices, [](const GradedDevice& d) {
        return d.grade.is_pass();
    });
    return all_passed ? EXIT_ALL_PASSED : EXIT_DEVICES_NOT_PASSING;
}

}  // namespace cli
