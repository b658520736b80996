#include "hal/acpi.hpp"
#include <cstddef>
#include "libs/log.hpp"
#include "uacpi/status.h"
#include "uacpi/tables.h"

// GICC.flags bit 0: the processor is usable.
#define MADT_GICC_ENABLED 0x1

namespace gic::hal {
namespace {
GicVersion version_from_madt(uint8_t gic_version) {
    switch (gic_version) {
        case 1:
            return GicVersion::V1;
        case 2:
            return GicVersion::V2;
        case 3:
            return GicVersion::V3;
        case 4:
            return GicVersion::V4;
        default:
            return GicVersion::Unknown;
    }
}

// Bytes an entry must span for every field read from it.
size_t min_entry_length(uint8_t type) {
    switch (type) {
        case ACPI_MADT_ENTRY_TYPE_GICC:
            // Fields after mpidr were added by later ACPI revisions.
            return offsetof(acpi_madt_gicc, mpidr) + sizeof(uint64_t);
        case ACPI_MADT_ENTRY_TYPE_GICD:
            return sizeof(acpi_madt_gicd);
        case ACPI_MADT_ENTRY_TYPE_GICR:
            return sizeof(acpi_madt_gicr);
        default:
            return sizeof(acpi_entry_hdr);
    }
}
}  // namespace

bool ACPI::parse_madt(const acpi_madt* madt, GicPlatformInfo& out) {
    out = {};

    bool have_gicd        = false;
    uint64_t gicc_rd_base = 0;

    const uintptr_t start = reinterpret_cast<uintptr_t>(madt->entries);
    const uintptr_t end   = reinterpret_cast<uintptr_t>(madt) + madt->hdr.length;

    uintptr_t entry = start;

    while (entry + sizeof(acpi_entry_hdr) <= end) {
        const acpi_entry_hdr* hdr = reinterpret_cast<const acpi_entry_hdr*>(entry);

        if (hdr->length < sizeof(acpi_entry_hdr) || entry + hdr->length > end) {
            LOG_WARN("ACPI: malformed MADT entry type=%u length=%u, stopping walk", hdr->type,
                     hdr->length);
            break;
        }

        if (hdr->length < min_entry_length(hdr->type)) {
            LOG_WARN("ACPI: truncated MADT entry type=%u length=%u skipped", hdr->type,
                     hdr->length);
            entry += hdr->length;
            continue;
        }

        switch (hdr->type) {
            case ACPI_MADT_ENTRY_TYPE_GICC: {
                // One per processor; carries the GICv2 CPU interface base and,
                // on GICv3 systems without GICR entries, the core's frame.
                const auto* gicc = reinterpret_cast<const acpi_madt_gicc*>(entry);

                if (!(gicc->flags & MADT_GICC_ENABLED)) {
                    LOG_DEBUG("ACPI: GICC uid=%u disabled, skipped", gicc->acpi_id);
                    break;
                }

                out.cpu_count++;

                if (!out.cpu_interface) {
                    out.cpu_interface = gicc->address;
                }

                if (gicc->gicr_base_address &&
                    (!gicc_rd_base || gicc->gicr_base_address < gicc_rd_base)) {
                    gicc_rd_base = gicc->gicr_base_address;
                }

                LOG_DEBUG("ACPI: GICC uid=%u mpidr=0x%lx base=0x%lx", gicc->acpi_id,
                          static_cast<unsigned long>(gicc->mpidr),
                          static_cast<unsigned long>(gicc->address));
                break;
            }
            case ACPI_MADT_ENTRY_TYPE_GICD: {
                const auto* gicd = reinterpret_cast<const acpi_madt_gicd*>(entry);

                if (have_gicd) {
                    LOG_WARN("ACPI: second GICD entry ignored");
                    break;
                }

                have_gicd       = true;
                out.distributor = gicd->address;
                out.version     = version_from_madt(gicd->gic_version);

                LOG_DEBUG("ACPI: GICD base=0x%lx version=%u",
                          static_cast<unsigned long>(gicd->address), gicd->gic_version);
                break;
            }
            case ACPI_MADT_ENTRY_TYPE_GICR: {
                // Discovery ranges; frames are walked until GICR_TYPER.Last,
                // so one contiguous range starting at the lowest base is kept.
                const auto* gicr = reinterpret_cast<const acpi_madt_gicr*>(entry);

                if (!out.redistributor || gicr->address < out.redistributor) {
                    out.redistributor        = gicr->address;
                    out.redistributor_length = gicr->length;
                }

                LOG_DEBUG("ACPI: GICR base=0x%lx length=0x%x",
                          static_cast<unsigned long>(gicr->address), gicr->length);
                break;
            }
            default:
                break;
        }

        entry += hdr->length;
    }

    if (!have_gicd) {
        LOG_WARN("ACPI: MADT has no GICD entry");
        return false;
    }

    if (!out.redistributor && gicc_rd_base) {
        out.redistributor = gicc_rd_base;
    }

    // Firmware may leave the version field zero; redistributors only exist
    // from GICv3 on.
    if (out.version == GicVersion::Unknown) {
        out.version = out.redistributor ? GicVersion::V3 : GicVersion::V2;
        LOG_INFO("ACPI: GIC version not reported, assuming %s", gic_version_name(out.version));
    }

    LOG_INFO("ACPI: %s distributor=0x%lx, %u CPU(s)", gic_version_name(out.version),
             static_cast<unsigned long>(out.distributor), out.cpu_count);

    return true;
}

bool ACPI::discover_gic(GicPlatformInfo& out) {
    uacpi_table table;

    if (uacpi_table_find_by_signature(ACPI_MADT_SIGNATURE, &table) != UACPI_STATUS_OK) {
        LOG_WARN("ACPI: MADT not found; GIC must be described another way");
        return false;
    }

    bool found = parse_madt(static_cast<const acpi_madt*>(table.ptr), out);
    uacpi_table_unref(&table);

    return found;
}
}  // namespace gic::hal
