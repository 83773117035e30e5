/**
 * @file CliApplication.hpp
 * @brief Command-line front end for batch drive grading
 */

#pragma once

#include "models/DiscoveryTypes.hpp"
#include "models/GradeResult.hpp"
#include "models/ThresholdPolicy.hpp"
#include "services/HealthScanService.hpp"
#include "util/Error.hpp"

#include <expected>
#include <ostream>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool json_output = false;
    bool debug = false;
    bool quiet = false;
    DiscoveryOptions discovery;
    ScanOptions scan;
    ThresholdLimits limits;
};

/**
 * @brief Process exit codes
 */
enum ExitCode : int {
    EXIT_ALL_PASSED = 0,
    EXIT_USAGE_OR_SCAN_ERROR = 1,
    EXIT_DEVICES_NOT_PASSING = 2
};

/**
 * @class CliApplication
 * @brief Scans all reachable drives and prints one verdict per drive
 */
class CliApplication {
public:
    CliApplication() = default;
    ~CliApplication() = default;

    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return ExitCode value
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @return Options, or an error naming the offending flag
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[])
        -> std::expected<CliOptions, util::Error>;

    static void print_help();
    static void print_version();

    /**
     * @brief Fixed-width table, one row per device
     */
    static void print_table(const std::vector<GradedDevice>& devices, std::ostream& out);

    /**
     * @brief JSON array of {identity, attributes, grade} objects
     */
    static void print_json(const std::vector<GradedDevice>& devices, std::ostream& out);

    /**
     * @brief EXIT_ALL_PASSED unless some device failed or errored
     */
    [[nodiscard]] static auto exit_code_for(const std::vector<GradedDevice>& devices) -> int;

private:
    /**
     * @brief Set up file logging under the user data directory
     */
    static void init_logging(const CliOptions& options);

    auto cmd_scan(const CliOptions& options) -> int;
};

}  // namespace cli
