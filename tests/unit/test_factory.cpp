// File: tests/unit/test_factory.cpp
// Purpose: Firmware layout to mapped configuration to backend instance.
// Key invariants: make_config maps exactly the windows the version needs and
//                 rejects incomplete layouts; create_controller picks GicV2
//                 for v1/v2 and GicV3 (with the v4 frame stride) for v3/v4,
//                 and refuses configurations missing a window.
// Ownership/Lifetime: Tests own the returned controller via unique_ptr.

#include <gtest/gtest.h>

#include <memory>
#include <vector>
#include "hal/gic.hpp"
#include "hal/gic_v3.hpp"
#include "fake_mmio.hpp"
#include "fake_sysregs.hpp"
#include "internal/gic_dist.h"
#include "internal/gic_v3.h"

using namespace gic::hal;
using gic::test::FakeMmio;
using gic::test::FakeSystemRegisters;

namespace {
constexpr uint64_t GICD_PHYS = 0x08000000;
constexpr uint64_t GICC_PHYS = 0x08010000;
constexpr uint64_t GICR_PHYS = 0x080A0000;

struct Platform {
    FakeMmio gicd{GICD_WINDOW_SIZE};
    FakeMmio gicc{GICC_WINDOW_SIZE};
    FakeMmio gicr{2 * GicV3::GICR_STRIDE_V4};

    struct Mapping {
        uint64_t phys;
        size_t size;
    };

    std::vector<Mapping> mappings;
    bool fail = false;
};

uintptr_t map_fake(uint64_t phys, size_t size, void* ctx) {
    Platform* p = static_cast<Platform*>(ctx);

    if (p->fail) {
        return 0;
    }

    p->mappings.push_back({phys, size});

    switch (phys) {
        case GICD_PHYS:
            return p->gicd.base();
        case GICC_PHYS:
            return p->gicc.base();
        case GICR_PHYS:
            return p->gicr.base();
        default:
            return 0;
    }
}

GicPlatformInfo v2_info() {
    GicPlatformInfo info{};
    info.version       = GicVersion::V2;
    info.distributor   = GICD_PHYS;
    info.cpu_interface = GICC_PHYS;
    info.cpu_count     = 1;
    return info;
}

GicPlatformInfo v3_info(GicVersion version) {
    GicPlatformInfo info{};
    info.version       = version;
    info.distributor   = GICD_PHYS;
    info.redistributor = GICR_PHYS;
    info.cpu_count     = 2;
    return info;
}
}  // namespace

TEST(MakeConfigTest, MapsDistributorAndCpuInterfaceForV2) {
    Platform platform;
    GicConfig config;

    ASSERT_TRUE(make_config(v2_info(), map_fake, &platform, config));

    EXPECT_EQ(config.version, GicVersion::V2);
    EXPECT_EQ(config.distributor, platform.gicd.base());
    EXPECT_EQ(config.cpu_interface, platform.gicc.base());
    EXPECT_EQ(config.redistributor, 0u);

    ASSERT_EQ(platform.mappings.size(), 2u);
    EXPECT_EQ(platform.mappings[0].size, GICD_WINDOW_SIZE);
    EXPECT_EQ(platform.mappings[1].size, GICC_WINDOW_SIZE);
}

TEST(MakeConfigTest, DerivesRedistributorRangeFromCpuCount) {
    Platform platform;
    GicConfig config;

    ASSERT_TRUE(make_config(v3_info(GicVersion::V3), map_fake, &platform, config));
    EXPECT_EQ(config.redistributor, platform.gicr.base());
    EXPECT_EQ(config.redistributor_size, 2 * GicV3::GICR_STRIDE_V3);

    ASSERT_TRUE(make_config(v3_info(GicVersion::V4), map_fake, &platform, config));
    EXPECT_EQ(config.redistributor_size, 2 * GicV3::GICR_STRIDE_V4);
}

TEST(MakeConfigTest, PrefersTheFirmwareRedistributorLength) {
    Platform platform;
    GicConfig config;
    GicPlatformInfo info = v3_info(GicVersion::V3);

    info.redistributor_length = 0x80000;

    ASSERT_TRUE(make_config(info, map_fake, &platform, config));
    EXPECT_EQ(config.redistributor_size, 0x80000u);
}

TEST(MakeConfigTest, RejectsIncompleteLayouts) {
    Platform platform;
    GicConfig config;

    GicPlatformInfo unknown = v2_info();
    unknown.version         = GicVersion::Unknown;
    EXPECT_FALSE(make_config(unknown, map_fake, &platform, config));

    GicPlatformInfo no_gicd = v2_info();
    no_gicd.distributor     = 0;
    EXPECT_FALSE(make_config(no_gicd, map_fake, &platform, config));

    GicPlatformInfo no_gicc = v2_info();
    no_gicc.cpu_interface   = 0;
    EXPECT_FALSE(make_config(no_gicc, map_fake, &platform, config));

    GicPlatformInfo no_gicr = v3_info(GicVersion::V3);
    no_gicr.redistributor   = 0;
    EXPECT_FALSE(make_config(no_gicr, map_fake, &platform, config));

    GicPlatformInfo no_cpus = v3_info(GicVersion::V3);
    no_cpus.cpu_count       = 0;
    EXPECT_FALSE(make_config(no_cpus, map_fake, &platform, config));
}

TEST(MakeConfigTest, MapperFailureIsReported) {
    Platform platform;
    GicConfig config;

    platform.fail = true;
    EXPECT_FALSE(make_config(v2_info(), map_fake, &platform, config));
}

TEST(CreateControllerTest, V1AndV2UseTheGicV2Backend) {
    Platform platform;
    GicConfig config;

    ASSERT_TRUE(make_config(v2_info(), map_fake, &platform, config));
    std::unique_ptr<IGenericGic> gic(create_controller(config, nullptr));

    ASSERT_NE(gic.get(), nullptr);
    EXPECT_STREQ(gic->name(), "GICv2");

    config.version = GicVersion::V1;
    std::unique_ptr<IGenericGic> v1(create_controller(config, nullptr));

    ASSERT_NE(v1.get(), nullptr);
    EXPECT_STREQ(v1->name(), "GICv2");
}

TEST(CreateControllerTest, V3NeedsSystemRegisters) {
    Platform platform;
    GicConfig config;

    ASSERT_TRUE(make_config(v3_info(GicVersion::V3), map_fake, &platform, config));
    EXPECT_EQ(create_controller(config, nullptr), nullptr);

    FakeSystemRegisters sysregs;
    std::unique_ptr<IGenericGic> gic(create_controller(config, &sysregs));

    ASSERT_NE(gic.get(), nullptr);
    EXPECT_STREQ(gic->name(), "GICv3");
}

TEST(CreateControllerTest, UnknownVersionHasNoBackend) {
    GicConfig config{};

    EXPECT_EQ(create_controller(config, nullptr), nullptr);
}

TEST(CreateControllerTest, RejectsConfigurationsWithoutMappedWindows) {
    Platform platform;
    FakeSystemRegisters sysregs;

    GicConfig no_gicc{};
    no_gicc.version     = GicVersion::V2;
    no_gicc.distributor = platform.gicd.base();
    EXPECT_EQ(create_controller(no_gicc, nullptr), nullptr);

    GicConfig no_gicd{};
    no_gicd.version       = GicVersion::V2;
    no_gicd.cpu_interface = platform.gicc.base();
    EXPECT_EQ(create_controller(no_gicd, nullptr), nullptr);

    GicConfig no_gicr{};
    no_gicr.version     = GicVersion::V3;
    no_gicr.distributor = platform.gicd.base();
    EXPECT_EQ(create_controller(no_gicr, &sysregs), nullptr);

    GicConfig short_gicr{};
    short_gicr.version            = GicVersion::V4;
    short_gicr.distributor        = platform.gicd.base();
    short_gicr.redistributor      = platform.gicr.base();
    short_gicr.redistributor_size = GicV3::GICR_STRIDE_V3;
    EXPECT_EQ(create_controller(short_gicr, &sysregs), nullptr);
}

TEST(CreateControllerTest, AcceptsAHandBuiltConfiguration) {
    Platform platform;
    FakeSystemRegisters sysregs;

    GicConfig config{};
    config.version            = GicVersion::V3;
    config.distributor        = platform.gicd.base();
    config.redistributor      = platform.gicr.base();
    config.redistributor_size = GicV3::GICR_STRIDE_V3;

    std::unique_ptr<IGenericGic> gic(create_controller(config, &sysregs));

    ASSERT_NE(gic.get(), nullptr);
    EXPECT_STREQ(gic->name(), "GICv3");
}

TEST(CreateControllerTest, V4WalksRedistributorsWithTheWiderStride) {
    Platform platform;
    GicConfig config;
    FakeSystemRegisters sysregs;

    platform.gicd.write32(GICD_TYPER, 1);
    platform.gicr.write64(GicV3::GICR_STRIDE_V4 + GICR_TYPER, (1ull << 32) | GICR_TYPER_LAST);
    sysregs.set_mpidr(0x80000001);

    ASSERT_TRUE(make_config(v3_info(GicVersion::V4), map_fake, &platform, config));
    std::unique_ptr<IGenericGic> gic(create_controller(config, &sysregs));
    ASSERT_NE(gic.get(), nullptr);

    gic->init_primary();
    gic->per_cpu_init();

    EXPECT_EQ(platform.gicr.read32(GicV3::GICR_STRIDE_V4 + GICR_ISENABLER0), 0x0000FFFFu);
    EXPECT_EQ(platform.gicr.read32(GICR_ISENABLER0), 0u);
}

TEST(GicVersionTest, Names) {
    EXPECT_STREQ(gic_version_name(GicVersion::V2), "GICv2");
    EXPECT_STREQ(gic_version_name(GicVersion::V4), "GICv4");
    EXPECT_STREQ(gic_version_name(GicVersion::Unknown), "unknown");
}
