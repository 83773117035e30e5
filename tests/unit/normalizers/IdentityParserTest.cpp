/**
 * @file IdentityParserTest.cpp
 * @brief Unit tests for IdentityParser
 */

#include "normalizers/IdentityParser.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

class IdentityParserTest : public ::testing::Test {
protected:
    DeviceCandidate ata_candidate = MockDiscoveryService::CreateCandidate(0, "/dev/sda");
    DeviceCandidate nvme_candidate =
        MockDiscoveryService::CreateCandidate(1, "/dev/nvme0", Protocol::NVME, "nvme");
    DeviceCandidate scsi_candidate =
        MockDiscoveryService::CreateCandidate(2, "/dev/sdb", Protocol::SCSI, "scsi");
};

// ========== parse Tests ==========

TEST_F(IdentityParserTest, Parse_AtaDocument_ExtractsIdentity) {
    auto identity = IdentityParser::parse(ata_candidate, smartctl_json::AtaDocument());

    EXPECT_EQ(identity.path, "/dev/sda");
    EXPECT_EQ(identity.protocol, Protocol::ATA);
    EXPECT_EQ(identity.device_type, "sat");
    EXPECT_EQ(identity.vendor, "Samsung");
    EXPECT_EQ(identity.model, "SSD 860 EVO 500GB");
    EXPECT_EQ(identity.serial, "S3Z1NB0K123456");
    EXPECT_EQ(identity.firmware, "RVT04B6Q");
    EXPECT_EQ(identity.capacity_bytes, 500107862016ULL);
    EXPECT_EQ(identity.media_type, MediaType::SSD);
}

TEST_F(IdentityParserTest, Parse_NvmeDocument_AlwaysSsd) {
    auto identity = IdentityParser::parse(
        nvme_candidate, smartctl_json::NvmeDocument(smartctl_json::HealthyNvmeLog()));

    EXPECT_EQ(identity.protocol, Protocol::NVME);
    EXPECT_EQ(identity.vendor, "Samsung");
    EXPECT_EQ(identity.media_type, MediaType::SSD);
}

TEST_F(IdentityParserTest, Parse_ScsiDocument_UsesScsiFields) {
    auto identity = IdentityParser::parse(scsi_candidate, smartctl_json::ScsiDocument());

    EXPECT_EQ(identity.vendor, "Seagate");
    EXPECT_EQ(identity.model, "ST4000NM0023");
    EXPECT_EQ(identity.firmware, "0004");
    EXPECT_EQ(identity.serial, "Z1Z0ABCD");
    EXPECT_EQ(identity.media_type, MediaType::HDD);
}

TEST_F(IdentityParserTest, Parse_ScsiModelNameOnly_UsedAsModel) {
    nlohmann::json document = {{"scsi_model_name", "HUS726040ALS210"}};

    auto identity = IdentityParser::parse(scsi_candidate, document);

    EXPECT_EQ(identity.model, "HUS726040ALS210");
    EXPECT_EQ(identity.vendor, "HGST");
}

TEST_F(IdentityParserTest, Parse_UnknownVendorReported_KeptVerbatim) {
    nlohmann::json document = {{"vendor", "Acme Storage"}, {"model_name", "X100"}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "Acme Storage");
    EXPECT_EQ(identity.model, "X100");
}

TEST_F(IdentityParserTest, Parse_ModelFamilyBrand_UsedWhenModelHasNone) {
    nlohmann::json document = {{"model_family", "Toshiba 2.5\" HDD MQ01ABD..."},
                               {"model_name", "MQ01ABD100"}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "Toshiba");
    EXPECT_EQ(identity.model, "MQ01ABD100");
}

TEST_F(IdentityParserTest, Parse_ModelFamilyBrand_WinsOverModelPrefix) {
    nlohmann::json document = {{"model_family", "HGST Ultrastar 7K6000"},
                               {"model_name", "ST4000NM0023"}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "HGST");
}

TEST_F(IdentityParserTest, Parse_ModelFamilyWithoutBrand_KeptVerbatim) {
    nlohmann::json document = {{"model_family", "SandForce Driven SSDs"},
                               {"model_name", "SATA SSD"}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "SandForce Driven SSDs");
}

TEST_F(IdentityParserTest, Parse_ReportedVendor_WinsOverModelFamily) {
    nlohmann::json document = {{"vendor", "Acme Storage"},
                               {"model_family", "Toshiba 2.5\" HDD MQ01ABD..."},
                               {"model_name", "MQ01ABD100"}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "Acme Storage");
}

TEST_F(IdentityParserTest, Parse_EmptyDocument_KeepsCandidateFields) {
    auto identity = IdentityParser::parse(ata_candidate, nlohmann::json::object());

    EXPECT_EQ(identity.path, "/dev/sda");
    EXPECT_EQ(identity.protocol, Protocol::ATA);
    EXPECT_TRUE(identity.model.empty());
    EXPECT_TRUE(identity.serial.empty());
    EXPECT_FALSE(identity.capacity_bytes.has_value());
    EXPECT_EQ(identity.media_type, MediaType::UNKNOWN);
}

TEST_F(IdentityParserTest, Parse_SpinningDrive_Hdd) {
    nlohmann::json document = {{"model_name", "ST8000DM004-2CX188"}, {"rotation_rate", 5425}};

    auto identity = IdentityParser::parse(ata_candidate, document);

    EXPECT_EQ(identity.vendor, "Seagate");
    EXPECT_EQ(identity.media_type, MediaType::HDD);
}

TEST_F(IdentityParserTest, FromCandidate_CopiesDiscoveryFields) {
    auto identity = IdentityParser::from_candidate(nvme_candidate);

    EXPECT_EQ(identity.path, "/dev/nvme0");
    EXPECT_EQ(identity.protocol, Protocol::NVME);
    EXPECT_EQ(identity.device_type, "nvme");
    EXPECT_TRUE(identity.vendor.empty());
}

// ========== Brand Tests ==========

TEST_F(IdentityParserTest, CanonicalBrand_CaseInsensitive) {
    EXPECT_EQ(IdentityParser::canonical_brand("wdc"), "Western Digital");
    EXPECT_EQ(IdentityParser::canonical_brand("SanDisk"), "SanDisk");
    EXPECT_EQ(IdentityParser::canonical_brand("KINGSTON"), "Kingston");
    EXPECT_FALSE(IdentityParser::canonical_brand("SSD").has_value());
}

TEST_F(IdentityParserTest, VendorFromModel_BrandWord_Found) {
    EXPECT_EQ(IdentityParser::vendor_from_model("WDC WD40EFRX-68N32N0"), "Western Digital");
    EXPECT_EQ(IdentityParser::vendor_from_model("KINGSTON SA400S37240G"), "Kingston");
    EXPECT_EQ(IdentityParser::vendor_from_model("Micron_5200_MTFDDAK960TDD"), "Micron");
}

TEST_F(IdentityParserTest, VendorFromModel_PrefixHeuristics) {
    EXPECT_EQ(IdentityParser::vendor_from_model("MB2000GCWDA"), "HPE");
    EXPECT_EQ(IdentityParser::vendor_from_model("SSDSC2KB480G8"), "Intel");
    EXPECT_EQ(IdentityParser::vendor_from_model("MZ7LH960HAJR-00005"), "Samsung");
    EXPECT_EQ(IdentityParser::vendor_from_model("THNSN5256GPUK"), "Toshiba");
    EXPECT_EQ(IdentityParser::vendor_from_model("WD10EZEX-08WN4A0"), "Western Digital");
}

TEST_F(IdentityParserTest, VendorFromModel_Unknown_ReturnsNullopt) {
    EXPECT_FALSE(IdentityParser::vendor_from_model("QEMU HARDDISK").has_value());
    EXPECT_FALSE(IdentityParser::vendor_from_model("").has_value());
    EXPECT_FALSE(IdentityParser::vendor_from_model("MB20").has_value());
}

TEST_F(IdentityParserTest, StripBrand_LeadingBrandRemoved) {
    EXPECT_EQ(IdentityParser::strip_brand("WDC WD40EFRX-68N32N0"), "WD40EFRX-68N32N0");
    EXPECT_EQ(IdentityParser::strip_brand("Micron_5200_MTFDDAK960TDD"), "5200_MTFDDAK960TDD");
}

TEST_F(IdentityParserTest, StripBrand_NoBrandOrBrandOnly_Unchanged) {
    EXPECT_EQ(IdentityParser::strip_brand("ST4000NM0023"), "ST4000NM0023");
    EXPECT_EQ(IdentityParser::strip_brand("Samsung"), "Samsung");
    EXPECT_EQ(IdentityParser::strip_brand("QEMU HARDDISK"), "QEMU HARDDISK");
}
