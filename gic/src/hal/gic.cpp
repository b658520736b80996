#include "hal/gic.hpp"
#include "hal/gic_v2.hpp"
#include "hal/gic_v3.hpp"
#include "libs/log.hpp"

namespace gic::hal {
namespace {
bool is_v2_family(GicVersion version) {
    return version == GicVersion::V1 || version == GicVersion::V2;
}

bool is_v3_family(GicVersion version) {
    return version == GicVersion::V3 || version == GicVersion::V4;
}

size_t redistributor_stride(GicVersion version) {
    return version == GicVersion::V4 ? GicV3::GICR_STRIDE_V4 : GicV3::GICR_STRIDE_V3;
}
}  // namespace

const char* gic_version_name(GicVersion version) {
    switch (version) {
        case GicVersion::V1:
            return "GICv1";
        case GicVersion::V2:
            return "GICv2";
        case GicVersion::V3:
            return "GICv3";
        case GicVersion::V4:
            return "GICv4";
        default:
            return "unknown";
    }
}

bool make_config(const GicPlatformInfo& info, MmioMapper mapper, void* ctx, GicConfig& out) {
    out = {};

    if (!is_v2_family(info.version) && !is_v3_family(info.version)) {
        LOG_ERROR("GIC: cannot configure controller of version %s",
                  gic_version_name(info.version));
        return false;
    }

    if (!info.distributor) {
        LOG_ERROR("GIC: firmware reported no distributor");
        return false;
    }

    out.version     = info.version;
    out.distributor = mapper(info.distributor, GICD_WINDOW_SIZE, ctx);

    if (!out.distributor) {
        LOG_ERROR("GIC: failed to map distributor at 0x%lx",
                  static_cast<unsigned long>(info.distributor));
        return false;
    }

    if (is_v2_family(info.version)) {
        if (!info.cpu_interface) {
            LOG_ERROR("GIC: firmware reported no CPU interface for %s",
                      gic_version_name(info.version));
            return false;
        }

        out.cpu_interface = mapper(info.cpu_interface, GICC_WINDOW_SIZE, ctx);

        if (!out.cpu_interface) {
            LOG_ERROR("GIC: failed to map CPU interface at 0x%lx",
                      static_cast<unsigned long>(info.cpu_interface));
            return false;
        }

        return true;
    }

    if (!info.redistributor) {
        LOG_ERROR("GIC: firmware reported no redistributor for %s",
                  gic_version_name(info.version));
        return false;
    }

    size_t length = info.redistributor_length;

    // Without a discovery range, assume one contiguous frame per core.
    if (length == 0) {
        length = static_cast<size_t>(info.cpu_count) * redistributor_stride(info.version);
    }

    if (length == 0) {
        LOG_ERROR("GIC: redistributor range has zero length");
        return false;
    }

    out.redistributor      = mapper(info.redistributor, length, ctx);
    out.redistributor_size = length;

    if (!out.redistributor) {
        LOG_ERROR("GIC: failed to map redistributors at 0x%lx",
                  static_cast<unsigned long>(info.redistributor));
        return false;
    }

    return true;
}

IGenericGic* create_controller(const GicConfig& config, ISystemRegisters* sysregs) {
    if (!is_v2_family(config.version) && !is_v3_family(config.version)) {
        LOG_ERROR("GIC: no backend for version %s", gic_version_name(config.version));
        return nullptr;
    }

    if (!config.distributor) {
        LOG_ERROR("GIC: %s configuration has no distributor mapping",
                  gic_version_name(config.version));
        return nullptr;
    }

    MMIORegion gicd(config.distributor, GICD_WINDOW_SIZE);

    if (is_v2_family(config.version)) {
        if (!config.cpu_interface) {
            LOG_ERROR("GIC: %s configuration has no CPU interface mapping",
                      gic_version_name(config.version));
            return nullptr;
        }

        LOG_INFO("GIC: using %s backend (gicd=0x%lx gicc=0x%lx)",
                 gic_version_name(config.version), static_cast<unsigned long>(config.distributor),
                 static_cast<unsigned long>(config.cpu_interface));

        return new GicV2(gicd, MMIORegion(config.cpu_interface, GICC_WINDOW_SIZE));
    }

    if (!sysregs) {
        LOG_ERROR("GIC: %s needs system register access", gic_version_name(config.version));
        return nullptr;
    }

    // At least the boot core's frame must be mapped.
    if (!config.redistributor || config.redistributor_size < redistributor_stride(config.version)) {
        LOG_ERROR("GIC: %s configuration has no usable redistributor mapping",
                  gic_version_name(config.version));
        return nullptr;
    }

    LOG_INFO("GIC: using %s backend (gicd=0x%lx gicr=0x%lx+0x%zx)",
             gic_version_name(config.version), static_cast<unsigned long>(config.distributor),
             static_cast<unsigned long>(config.redistributor), config.redistributor_size);

    return new GicV3(gicd, MMIORegion(config.redistributor, config.redistributor_size), *sysregs,
                     redistributor_stride(config.version));
}
}  // namespace gic::hal
