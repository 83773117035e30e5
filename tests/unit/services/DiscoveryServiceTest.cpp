/**
 * @file DiscoveryServiceTest.cpp
 * @brief Unit tests for DiscoveryService
 *
 * smartctl is replaced by MockCommandExecutor; each test scripts the JSON
 * the tool would print.
 */

#include "services/DiscoveryService.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using testing::_;
using testing::AllOf;
using testing::Return;

class DiscoveryServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<MockCommandExecutor> executor = MockCommandExecutor::CreateNiceMock();
    std::atomic<bool> cancel_flag{false};

    DiscoveryService CreateService(DiscoveryOptions options = {}) {
        return DiscoveryService(executor, std::move(options));
    }

    void ScanReturns(const nlohmann::json& devices) {
        ON_CALL(*executor, execute(HasArg("--scan-open")))
            .WillByDefault(Return(
                MockCommandExecutor::Output(nlohmann::json{{"devices", devices}}.dump())));
    }

    static nlohmann::json ScanDevice(const std::string& name, const std::string& type,
                                     const std::string& protocol) {
        return nlohmann::json{{"name", name},
                              {"info_name", name},
                              {"type", type},
                              {"protocol", protocol}};
    }
};

// ========== parse_scan_output Tests ==========

TEST_F(DiscoveryServiceTest, ParseScanOutput_Devices_ReturnsEntries) {
    auto output = R"({"devices": [
        {"name": "/dev/sda", "type": "sat", "protocol": "ATA"},
        {"name": "/dev/sdb", "type": "scsi", "protocol": "SCSI",
         "open_error": "Permission denied"}
    ]})";

    auto entries = DiscoveryService::parse_scan_output(output);

    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0], (ScanEntry{.name = "/dev/sda", .type = "sat", .protocol = "ATA"}));
    EXPECT_EQ((*entries)[1].open_error, "Permission denied");
}

TEST_F(DiscoveryServiceTest, ParseScanOutput_NoDevicesKey_EmptyList) {
    auto entries = DiscoveryService::parse_scan_output(R"({"smartctl": {}})");

    ASSERT_TRUE(entries.has_value());
    EXPECT_TRUE(entries->empty());
}

TEST_F(DiscoveryServiceTest, ParseScanOutput_NotJson_ReturnsParseError) {
    auto entries = DiscoveryService::parse_scan_output("/dev/sda -d sat # /dev/sda");

    ASSERT_FALSE(entries.has_value());
    EXPECT_TRUE(entries.error().is(util::ErrorCode::PARSE_FAILED));
}

TEST_F(DiscoveryServiceTest, ParseScanOutput_EntryWithoutName_Skipped) {
    auto entries = DiscoveryService::parse_scan_output(R"({"devices": [{"type": "sat"}]})");

    ASSERT_TRUE(entries.has_value());
    EXPECT_TRUE(entries->empty());
}

// ========== classify Tests ==========

TEST_F(DiscoveryServiceTest, Classify_ProtocolString_Wins) {
    EXPECT_EQ(DiscoveryService::classify("sat", "ATA"), Protocol::ATA);
    EXPECT_EQ(DiscoveryService::classify("nvme", "NVMe"), Protocol::NVME);
    EXPECT_EQ(DiscoveryService::classify("scsi", "SCSI"), Protocol::SCSI);
}

TEST_F(DiscoveryServiceTest, Classify_UsbBridgeType_IsUsb) {
    EXPECT_EQ(DiscoveryService::classify("usbjmicron", "ATA"), Protocol::USB);
    EXPECT_EQ(DiscoveryService::classify("sntasmedia", "NVMe"), Protocol::USB);
}

TEST_F(DiscoveryServiceTest, Classify_TypeOnly_FallsBackToType) {
    EXPECT_EQ(DiscoveryService::classify("nvme", ""), Protocol::NVME);
    EXPECT_EQ(DiscoveryService::classify("sat", ""), Protocol::ATA);
    EXPECT_EQ(DiscoveryService::classify("scsi", ""), Protocol::SCSI);
    EXPECT_EQ(DiscoveryService::classify("", ""), Protocol::UNKNOWN);
}

TEST_F(DiscoveryServiceTest, IsSkippedPath_RaidBus_True) {
    EXPECT_TRUE(DiscoveryService::is_skipped_path("/dev/bus/0"));
    EXPECT_FALSE(DiscoveryService::is_skipped_path("/dev/sda"));
}

// ========== enumerate Tests ==========

TEST_F(DiscoveryServiceTest, Enumerate_ScanOutput_ReturnsCandidatesInOrder) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sda", "sat", "ATA"),
                                       ScanDevice("/dev/nvme0", "nvme", "NVMe"),
                                       ScanDevice("/dev/sdb", "scsi", "SCSI")}));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 3u);
    EXPECT_TRUE(result->failures.empty());
    EXPECT_EQ(result->devices[0], (DeviceCandidate{.order = 0,
                                                   .path = "/dev/sda",
                                                   .device_type = "sat",
                                                   .protocol = Protocol::ATA}));
    EXPECT_EQ(result->devices[1].protocol, Protocol::NVME);
    EXPECT_EQ(result->devices[2].order, 2u);
}

TEST_F(DiscoveryServiceTest, Enumerate_UsesConfiguredSmartctlPath) {
    EXPECT_CALL(*executor, execute(_))
        .WillOnce([](const Command& command) {
            EXPECT_EQ(command.argv.front(), "/usr/sbin/smartctl");
            EXPECT_EQ(command.timeout, std::chrono::milliseconds{5000});
            return MockCommandExecutor::Output(R"({"devices": []})");
        });
    auto service = CreateService({.smartctl_path = "/usr/sbin/smartctl",
                                  .command_timeout = std::chrono::milliseconds{5000}});

    ASSERT_TRUE(service.enumerate(cancel_flag).has_value());
}

TEST_F(DiscoveryServiceTest, Enumerate_IgnoreFlags_DropDevicesBeforeProbe) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sda", "sat", "ATA"),
                                       ScanDevice("/dev/nvme0", "nvme", "NVMe"),
                                       ScanDevice("/dev/sdc", "usbjmicron", "ATA")}));
    auto service = CreateService({.ignore_nvme = true, .ignore_usb = true});

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].path, "/dev/sda");
    EXPECT_EQ(result->devices[0].order, 0u);
}

TEST_F(DiscoveryServiceTest, Enumerate_RaidBusPath_Skipped) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/bus/0", "megaraid,0", "SCSI"),
                                       ScanDevice("/dev/sda", "sat", "ATA")}));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].path, "/dev/sda");
}

TEST_F(DiscoveryServiceTest, Enumerate_OpenError_BecomesFailure) {
    auto unopenable = ScanDevice("/dev/sdb", "scsi", "SCSI");
    unopenable["open_error"] = "/dev/sdb: Permission denied";
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sda", "sat", "ATA"), unopenable}));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->failures.size(), 1u);
    EXPECT_EQ(result->failures[0].path, "/dev/sdb");
    EXPECT_EQ(result->failures[0].order, 1u);
    EXPECT_TRUE(result->failures[0].error.is(util::ErrorCode::DEVICE_OPEN_FAILED));
    EXPECT_EQ(result->total(), 2u);
}

TEST_F(DiscoveryServiceTest, Enumerate_OpenErrorOnIgnoredProtocol_Dropped) {
    auto unopenable = ScanDevice("/dev/sdb", "scsi", "SCSI");
    unopenable["open_error"] = "Permission denied";
    ScanReturns(nlohmann::json::array({unopenable}));
    auto service = CreateService({.ignore_scsi = true});

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total(), 0u);
}

TEST_F(DiscoveryServiceTest, Enumerate_UnknownProtocol_DetectedWithInfo) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sdd", "auto", "")}));
    ON_CALL(*executor, execute(HasArg("--info")))
        .WillByDefault(Return(MockCommandExecutor::Output(
            R"({"device": {"name": "/dev/sdd", "type": "sat", "protocol": "ATA"}})")));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].protocol, Protocol::ATA);
}

TEST_F(DiscoveryServiceTest, Enumerate_DetectionFails_BecomesFailure) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sdd", "auto", "")}));
    ON_CALL(*executor, execute(HasArg("--info")))
        .WillByDefault(Return(MockCommandExecutor::Output("", 2)));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->devices.empty());
    ASSERT_EQ(result->failures.size(), 1u);
    EXPECT_TRUE(result->failures[0].error.is(util::ErrorCode::DEVICE_OPEN_FAILED));
}

TEST_F(DiscoveryServiceTest, Enumerate_ScanCannotSpawn_ReturnsScanFailed) {
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(util::ErrorCode::SCAN_FAILED));
}

TEST_F(DiscoveryServiceTest, Enumerate_ScanCommandLineError_ReturnsScanFailed) {
    ON_CALL(*executor, execute(_)).WillByDefault(Return(MockCommandExecutor::Output("", 1)));
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(util::ErrorCode::SCAN_FAILED));
}

TEST_F(DiscoveryServiceTest, Enumerate_ExplicitDevices_SkipsScanCommand) {
    EXPECT_CALL(*executor, execute(_)).Times(testing::AnyNumber());
    EXPECT_CALL(*executor, execute(HasArg("--scan-open"))).Times(0);
    ON_CALL(*executor, execute(HasArg("--info")))
        .WillByDefault(Return(MockCommandExecutor::Output(
            R"({"device": {"name": "/dev/nvme0", "type": "nvme", "protocol": "NVMe"}})")));
    auto service = CreateService({.explicit_devices = {"/dev/nvme0"}});

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].path, "/dev/nvme0");
    EXPECT_EQ(result->devices[0].protocol, Protocol::NVME);
}

TEST_F(DiscoveryServiceTest, Enumerate_CancelledDuringDetection_RemainingDevicesCancelled) {
    EXPECT_CALL(*executor, execute(_)).Times(testing::AnyNumber());
    EXPECT_CALL(*executor, execute(HasArg("--info")))
        .Times(1)
        .WillOnce([this](const Command&) {
            cancel_flag.store(true);
            return MockCommandExecutor::Output(
                R"({"device": {"name": "/dev/sda", "type": "sat", "protocol": "ATA"}})");
        });
    auto service = CreateService({.explicit_devices = {"/dev/sda", "/dev/sdb", "/dev/sdc"}});

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_EQ(result->devices[0].path, "/dev/sda");
    ASSERT_EQ(result->failures.size(), 2u);
    EXPECT_EQ(result->failures[0].path, "/dev/sdb");
    EXPECT_EQ(result->failures[0].order, 1u);
    EXPECT_TRUE(result->failures[0].error.is(util::ErrorCode::CANCELLED));
    EXPECT_EQ(result->failures[1].path, "/dev/sdc");
    EXPECT_TRUE(result->failures[1].error.is(util::ErrorCode::CANCELLED));
    EXPECT_EQ(result->total(), 3u);
}

TEST_F(DiscoveryServiceTest, Enumerate_CancelledWithKnownProtocols_NoDetectionNeeded) {
    ScanReturns(nlohmann::json::array({ScanDevice("/dev/sda", "sat", "ATA")}));
    cancel_flag.store(true);
    auto service = CreateService();

    auto result = service.enumerate(cancel_flag);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->devices.size(), 1u);
    EXPECT_TRUE(result->failures.empty());
}

// ========== probe Tests ==========

TEST_F(DiscoveryServiceTest, Probe_ValidJson_ReturnsTelemetry) {
    EXPECT_CALL(*executor, execute(AllOf(HasArg("--xall"), HasArg("--json"), HasArg("-d"),
                                         HasArg("sat"), HasArg("/dev/sda"))))
        .WillOnce(Return(MockCommandExecutor::Output(smartctl_json::AtaDocument().dump(), 4)));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_TRUE(telemetry.has_value());
    EXPECT_EQ(telemetry->exit_status, 4);
    EXPECT_EQ(telemetry->document["serial_number"], "S3Z1NB0K123456");
}

TEST_F(DiscoveryServiceTest, Probe_NoDeviceType_OmitsDashD) {
    EXPECT_CALL(*executor, execute(_)).WillOnce([](const Command& command) {
        EXPECT_TRUE(std::ranges::find(command.argv, std::string("-d")) == command.argv.end());
        EXPECT_EQ(command.argv.back(), "/dev/sdx");
        return MockCommandExecutor::Output(R"({"smart_status": {"passed": true}})");
    });
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sdx",
                                                                         Protocol::ATA, ""));

    EXPECT_TRUE(telemetry.has_value());
}

TEST_F(DiscoveryServiceTest, Probe_OpenFailedBit_ReturnsDeviceOpenFailedWithMessage) {
    ON_CALL(*executor, execute(_))
        .WillByDefault(Return(MockCommandExecutor::Output(
            R"({"smartctl": {"messages": [{"string": "Smartctl open device: /dev/sda failed: Permission denied", "severity": "error"}]}})",
            2)));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_FALSE(telemetry.has_value());
    EXPECT_TRUE(telemetry.error().is(util::ErrorCode::DEVICE_OPEN_FAILED));
    EXPECT_THAT(telemetry.error().message, testing::HasSubstr("Permission denied"));
}

TEST_F(DiscoveryServiceTest, Probe_CommandLineBit_ReturnsInvalidArgument) {
    ON_CALL(*executor, execute(_)).WillByDefault(Return(MockCommandExecutor::Output("{}", 1)));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_FALSE(telemetry.has_value());
    EXPECT_TRUE(telemetry.error().is(util::ErrorCode::INVALID_ARGUMENT));
}

TEST_F(DiscoveryServiceTest, Probe_EmptyOutput_ReturnsParseFailed) {
    ON_CALL(*executor, execute(_)).WillByDefault(Return(MockCommandExecutor::Output("")));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_FALSE(telemetry.has_value());
    EXPECT_TRUE(telemetry.error().is(util::ErrorCode::PARSE_FAILED));
}

TEST_F(DiscoveryServiceTest, Probe_TruncatedJson_ReturnsParseFailed) {
    ON_CALL(*executor, execute(_))
        .WillByDefault(Return(MockCommandExecutor::Output(R"({"smart_status": {"pass)")));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_FALSE(telemetry.has_value());
    EXPECT_TRUE(telemetry.error().is(util::ErrorCode::PARSE_FAILED));
}

TEST_F(DiscoveryServiceTest, Probe_ExecutorTimeout_Propagated) {
    ON_CALL(*executor, execute(_))
        .WillByDefault(Return(std::expected<CommandResult, util::Error>(std::unexpected(
            util::Error{"'smartctl' timed out after 30000 ms", util::ErrorCode::TIMED_OUT}))));
    auto service = CreateService();

    auto telemetry = service.probe(MockDiscoveryService::CreateCandidate(0, "/dev/sda"));

    ASSERT_FALSE(telemetry.has_value());
    EXPECT_TRUE(telemetry.error().is(util::ErrorCode::TIMED_OUT));
}
