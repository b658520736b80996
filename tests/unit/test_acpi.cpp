// File: tests/unit/test_acpi.cpp
// Purpose: MADT walking: GIC layout extraction from GICC/GICD/GICR entries.
// Key invariants: Disabled GICC entries are not counted; the lowest GICR
//                 range wins; a zero GICD version is inferred from the
//                 presence of redistributors; no GICD means no GIC;
//                 entries too short for their type are skipped.
// Ownership/Lifetime: Each test assembles its own table in a byte buffer.

#include <gtest/gtest.h>

#include <cstring>
#include <vector>
#include "hal/acpi.hpp"

using namespace gic::hal;

namespace {
class MadtBuilder {
   public:
    MadtBuilder() : bytes(sizeof(acpi_madt), 0) {}

    MadtBuilder& gicc(uint64_t base, bool enabled, uint64_t gicr_base = 0) {
        acpi_madt_gicc entry;
        std::memset(&entry, 0, sizeof(entry));

        entry.hdr.type          = ACPI_MADT_ENTRY_TYPE_GICC;
        entry.hdr.length        = sizeof(entry);
        entry.acpi_id           = this->next_uid++;
        entry.flags             = enabled ? 1 : 0;
        entry.address           = base;
        entry.gicr_base_address = gicr_base;

        return this->append(&entry, sizeof(entry));
    }

    MadtBuilder& gicd(uint64_t base, uint8_t version) {
        acpi_madt_gicd entry;
        std::memset(&entry, 0, sizeof(entry));

        entry.hdr.type    = ACPI_MADT_ENTRY_TYPE_GICD;
        entry.hdr.length  = sizeof(entry);
        entry.address     = base;
        entry.gic_version = version;

        return this->append(&entry, sizeof(entry));
    }

    MadtBuilder& gicr(uint64_t base, uint32_t length) {
        acpi_madt_gicr entry;
        std::memset(&entry, 0, sizeof(entry));

        entry.hdr.type   = ACPI_MADT_ENTRY_TYPE_GICR;
        entry.hdr.length = sizeof(entry);
        entry.address    = base;
        entry.length     = length;

        return this->append(&entry, sizeof(entry));
    }

    /// An entry of @p type whose length field claims only @p length bytes.
    MadtBuilder& truncated(uint8_t type, uint8_t length) {
        std::vector<uint8_t> entry(length, 0);

        entry[0] = type;
        entry[1] = length;

        return this->append(entry.data(), entry.size());
    }

    const acpi_madt* table() {
        acpi_madt* madt  = reinterpret_cast<acpi_madt*>(this->bytes.data());
        madt->hdr.length = static_cast<uint32_t>(this->bytes.size());
        return madt;
    }

   private:
    MadtBuilder& append(const void* entry, size_t size) {
        const uint8_t* raw = static_cast<const uint8_t*>(entry);
        this->bytes.insert(this->bytes.end(), raw, raw + size);
        return *this;
    }

    std::vector<uint8_t> bytes;
    uint32_t next_uid = 0;
};
}  // namespace

TEST(ParseMadtTest, GicV2Layout) {
    MadtBuilder madt;
    madt.gicd(0x08000000, 2).gicc(0x08010000, true).gicc(0x08010000, true);

    GicPlatformInfo info;
    ASSERT_TRUE(ACPI::parse_madt(madt.table(), info));

    EXPECT_EQ(info.version, GicVersion::V2);
    EXPECT_EQ(info.distributor, 0x08000000u);
    EXPECT_EQ(info.cpu_interface, 0x08010000u);
    EXPECT_EQ(info.redistributor, 0u);
    EXPECT_EQ(info.cpu_count, 2u);
}

TEST(ParseMadtTest, GicV3LayoutWithRedistributorRanges) {
    MadtBuilder madt;
    madt.gicc(0, true).gicd(0x08000000, 3).gicr(0x080C0000, 0x40000).gicr(0x080A0000, 0x20000);

    GicPlatformInfo info;
    ASSERT_TRUE(ACPI::parse_madt(madt.table(), info));

    EXPECT_EQ(info.version, GicVersion::V3);
    EXPECT_EQ(info.redistributor, 0x080A0000u);
    EXPECT_EQ(info.redistributor_length, 0x20000u);
}

TEST(ParseMadtTest, DisabledProcessorsAreNotCounted) {
    MadtBuilder madt;
    madt.gicd(0x08000000, 2).gicc(0x08010000, true).gicc(0x08010000, false);

    GicPlatformInfo info;
    ASSERT_TRUE(ACPI::parse_madt(madt.table(), info));

    EXPECT_EQ(info.cpu_count, 1u);
}

TEST(ParseMadtTest, RedistributorFallsBackToGiccFrames) {
    MadtBuilder madt;
    madt.gicd(0x08000000, 3).gicc(0, true, 0x080C0000).gicc(0, true, 0x080A0000);

    GicPlatformInfo info;
    ASSERT_TRUE(ACPI::parse_madt(madt.table(), info));

    EXPECT_EQ(info.redistributor, 0x080A0000u);
    EXPECT_EQ(info.redistributor_length, 0u);
}

TEST(ParseMadtTest, UnreportedVersionIsInferred) {
    MadtBuilder v3;
    v3.gicd(0x08000000, 0).gicr(0x080A0000, 0x20000).gicc(0, true);

    GicPlatformInfo info;
    ASSERT_TRUE(ACPI::parse_madt(v3.table(), info));
    EXPECT_EQ(info.version, GicVersion::V3);

    MadtBuilder v2;
    v2.gicd(0x08000000, 0).gicc(0x08010000, true);

    ASSERT_TRUE(ACPI::parse_madt(v2.table(), info));
    EXPECT_EQ(info.version, GicVersion::V2);
}

TEST(ParseMadtTest, TableWithoutDistributorIsRejected) {
    MadtBuilder madt;
    madt.gicc(0x08010000, true);

    GicPlatformInfo info;
    EXPECT_FALSE(ACPI::parse_madt(madt.table(), info));
}

TEST(ParseMadtTest, TruncatedEntriesAreSkipped) {
    MadtBuilder no_gicd;
    no_gicd.gicc(0x08010000, true).truncated(ACPI_MADT_ENTRY_TYPE_GICD, 8);

    GicPlatformInfo info;
    EXPECT_FALSE(ACPI::parse_madt(no_gicd.table(), info));

    MadtBuilder short_gicr;
    short_gicr.gicd(0x08000000, 3)
        .truncated(ACPI_MADT_ENTRY_TYPE_GICR, 8)
        .gicc(0, true, 0x080A0000)
        .truncated(ACPI_MADT_ENTRY_TYPE_GICC, 12);

    ASSERT_TRUE(ACPI::parse_madt(short_gicr.table(), info));
    EXPECT_EQ(info.redistributor, 0x080A0000u);
    EXPECT_EQ(info.redistributor_length, 0u);
    EXPECT_EQ(info.cpu_count, 1u);
}
