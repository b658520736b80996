#include "hal/gic_v2.hpp"
#include "internal/gic_dist.h"
#include "internal/gic_v2.h"
#include "arch.hpp"
#include "libs/log.hpp"

namespace gic::hal {
GicV2::GicV2(MMIORegion gicd, MMIORegion gicc) : dist(gicd), gicc(gicc) {}

uint32_t GicV2::current_cpu_interface() const {
    // Each byte of ITARGETSR0-7 reads as the calling core's own mask. A
    // uniprocessor implementation reads zero, which is interface 0.
    uint32_t mask = this->dist.read(GICD_ITARGETSR) & 0xFF;

    if (mask == 0) {
        return 0;
    }

    return static_cast<uint32_t>(__builtin_ctz(mask));
}

void GicV2::init_primary() {
    this->dist.reset();

    // Route every SPI to the core running the primary init.
    uint32_t mask   = 1u << this->current_cpu_interface();
    uint32_t target = mask * 0x01010101u;

    for (uint32_t i = IntId::SPI_START; i < this->dist.max_irq(); i += 4) {
        this->dist.write(GICD_ITARGETSR + i, target);
    }

    this->dist.enable_forwarding(GICD_CTLR_ENABLE_GRP0);

    LOG_INFO("GICv2: distributor initialised, SPIs routed to CPU mask 0x%x", mask);
}

void GicV2::per_cpu_init() {
    // Banked SGI/PPI state: PPIs start disabled, SGIs stay usable for IPIs.
    this->dist.write(GICD_ICENABLER, 0xFFFF0000);
    this->dist.write(GICD_ISENABLER, 0x0000FFFF);
    this->dist.write(GICD_ICPENDR, 0xFFFFFFFF);
    this->dist.write(GICD_ICACTIVER, 0xFFFFFFFF);

    for (uint32_t i = 0; i < IntId::SPI_START; i += 4) {
        this->dist.write(GICD_IPRIORITYR + i, GIC_DEFAULT_PRIORITY * 0x01010101u);
    }

    this->gicc.write<uint32_t>(GICC_PMR, GIC_PRIORITY_MASK_ALL);
    this->gicc.write<uint32_t>(GICC_BPR, 0);
    this->gicc.write<uint32_t>(GICC_CTLR, GICC_CTLR_ENABLE);

    LOG_INFO("GICv2: CPU interface %u enabled", this->current_cpu_interface());
}

void GicV2::set_trigger(IntId intid, TriggerMode trigger) {
    if (intid.is_sgi()) {
        // GICD_ICFGR0 is read-only: SGIs are always edge-triggered.
        LOG_WARN("GICv2: ignoring trigger change for SGI %u", intid.index());
        return;
    }

    this->dist.set_trigger(intid, trigger);
}

void GicV2::enable_interrupt(IntId intid) {
    this->dist.enable(intid);
}

void GicV2::disable_interrupt(IntId intid) {
    this->dist.disable(intid);
}

std::optional<IntId> GicV2::get_and_acknowledge_interrupt() {
    uint32_t iar = this->gicc.read<uint32_t>(GICC_IAR);
    arch::io_barrier();

    IntId intid(iar & GICC_IAR_INTID);

    if (intid.is_special()) {
        return std::nullopt;
    }

    if (intid.is_sgi()) {
        uint32_t cpu = this->current_cpu_interface();

        this->sgi_source[cpu][intid.raw()] = (iar >> GICC_IAR_CPUID_SHIFT) & GICC_IAR_CPUID;
    }

    return intid;
}

void GicV2::end_interrupt(IntId intid) {
    uint32_t eoir = intid.raw();

    if (intid.is_sgi()) {
        uint32_t source = this->sgi_source[this->current_cpu_interface()][intid.raw()];
        eoir |= source << GICC_IAR_CPUID_SHIFT;
    }

    arch::io_barrier();
    this->gicc.write<uint32_t>(GICC_EOIR, eoir);
}

void GicV2::send_sgi(IntId intid, SgiTarget target, uint8_t cpu_list) {
    if (!intid.is_sgi()) {
        PANIC("GICv2: send_sgi with non-SGI INTID %u", intid.raw());
    }

    uint32_t sgir = intid.raw();

    switch (target) {
        case SgiTarget::List:
            sgir |= GICD_SGIR_TARGET_LIST | (static_cast<uint32_t>(cpu_list) << 16);
            break;
        case SgiTarget::AllOthers:
            sgir |= GICD_SGIR_TARGET_OTHERS;
            break;
        case SgiTarget::Self:
            sgir |= GICD_SGIR_TARGET_SELF;
            break;
    }

    arch::io_barrier();
    this->dist.write(GICD_SGIR, sgir);

    LOG_DEBUG("GICv2: SGI %u sent (sgir=0x%x)", intid.raw(), sgir);
}
}  // namespace gic::hal
