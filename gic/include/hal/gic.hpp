#pragma once

#include <cstddef>
#include <cstdint>
#include "hal/interface/gic.hpp"
#include "hal/interface/sysregs.hpp"

namespace gic::hal {
enum class GicVersion : uint8_t {
    Unknown = 0,
    V1      = 1,
    V2      = 2,
    V3      = 3,
    V4      = 4,
};

/// Physical controller layout as reported by firmware (ACPI MADT).
struct GicPlatformInfo {
    GicVersion version;
    uint64_t distributor;
    uint64_t cpu_interface;         ///< GICv1/v2 only.
    uint64_t redistributor;         ///< GICv3/v4 only, first frame.
    uint64_t redistributor_length;  ///< Bytes covered by all frames.
    uint32_t cpu_count;             ///< Enabled GICC entries.
};

/// Virtual addresses of the mapped register windows.
struct GicConfig {
    GicVersion version;
    uintptr_t distributor;
    uintptr_t cpu_interface;
    uintptr_t redistributor;
    size_t redistributor_size;
};

constexpr size_t GICD_WINDOW_SIZE = 0x10000;
constexpr size_t GICC_WINDOW_SIZE = 0x2000;

/// Maps @p size bytes of device memory at @p phys, returns the virtual
/// address or 0 on failure.
using MmioMapper = uintptr_t (*)(uint64_t phys, size_t size, void* ctx);

/**
 * @brief Map the windows named in @p info and fill @p out.
 *
 * Returns false (and logs) when the version is unknown, a required base
 * is missing or the mapper fails.
 */
bool make_config(const GicPlatformInfo& info, MmioMapper mapper, void* ctx, GicConfig& out);

/**
 * @brief Instantiate the backend matching @p config.
 *
 * GICv1/v2 get a GicV2, GICv3/v4 a GicV3 (which needs @p sysregs). The
 * controller is heap-allocated and lives as long as the caller keeps it;
 * returns nullptr on an unusable configuration. Neither init_primary() nor
 * per_cpu_init() is called.
 */
IGenericGic* create_controller(const GicConfig& config, ISystemRegisters* sysregs);

const char* gic_version_name(GicVersion version);
}  // namespace gic::hal
