#include "hal/gic_v3.hpp"
#include "internal/gic_dist.h"
#include "internal/gic_v3.h"
#include "arch.hpp"
#include "libs/log.hpp"

namespace gic::hal {
namespace {
// MPIDR_EL1 keeps Aff0-2 in bits [23:0] and Aff3 in bits [39:32].
constexpr uint64_t mpidr_aff(uint64_t mpidr, unsigned level) {
    const unsigned shift = level == 3 ? 32 : level * 8;
    return (mpidr >> shift) & 0xFF;
}
}  // namespace

GicV3::GicV3(MMIORegion gicd, MMIORegion gicr, ISystemRegisters& sysregs, size_t gicr_stride)
    : dist(gicd), gicr(gicr), sysregs(sysregs), gicr_stride(gicr_stride), cpus() {}

uint32_t GicV3::affinity_of(uint64_t mpidr) {
    // Same packing as GICR_TYPER[63:32]: Aff3.Aff2.Aff1.Aff0.
    return static_cast<uint32_t>((mpidr_aff(mpidr, 3) << 24) | (mpidr_aff(mpidr, 2) << 16) |
                                 (mpidr_aff(mpidr, 1) << 8) | mpidr_aff(mpidr, 0));
}

void GicV3::init_primary() {
    this->dist.reset();

    uint64_t mpidr  = this->sysregs.read(SysReg::MpidrEl1);
    uint64_t router = mpidr & 0xFF00FFFFFFull;

    for (uint32_t i = IntId::SPI_START; i < this->dist.max_irq(); i += 32) {
        // Grouping is not used: everything is non-secure Group 1.
        this->dist.write(GICD_IGROUPR + (i / 32) * 4, 0xFFFFFFFF);
    }

    for (uint32_t i = IntId::SPI_START; i < this->dist.max_irq(); ++i) {
        this->dist.region().write<uint64_t>(GICD_IROUTER + i * 8, router);
    }

    this->dist.enable_forwarding(GICD_CTLR_ARE_NS | GICD_CTLR_ENABLE_GRP1);

    LOG_INFO("GICv3: distributor initialised, SPIs routed to affinity 0x%x",
             affinity_of(mpidr));
}

bool GicV3::find_redistributor(uint32_t affinity, MMIORegion& out) const {
    for (size_t offset = 0; offset + this->gicr_stride <= this->gicr.length();
         offset += this->gicr_stride) {
        uint64_t typer = this->gicr.read<uint64_t>(offset + GICR_TYPER);

        if ((typer >> 32) == affinity) {
            out = this->gicr.slice(offset, this->gicr_stride);
            return true;
        }

        if (typer & GICR_TYPER_LAST) {
            break;
        }
    }

    return false;
}

MMIORegion GicV3::current_redistributor() {
    uint32_t affinity = affinity_of(this->sysregs.read(SysReg::MpidrEl1));
    uint32_t count    = this->num_cpus.load(std::memory_order_acquire);

    for (uint32_t i = 0; i < count; ++i) {
        if (this->cpus[i].affinity == affinity) {
            return this->cpus[i].frame;
        }
    }

    PANIC("GICv3: affinity 0x%x used the GIC before per_cpu_init", affinity);
}

void GicV3::wake_redistributor(MMIORegion& rd) {
    uint32_t waker = rd.read<uint32_t>(GICR_WAKER);
    rd.write<uint32_t>(GICR_WAKER, waker & ~GICR_WAKER_PROCESSOR_SLEEP);

    for (uint32_t spins = 0; spins < GIC_RWP_TIMEOUT; ++spins) {
        if (!(rd.read<uint32_t>(GICR_WAKER) & GICR_WAKER_CHILDREN_ASLEEP)) {
            return;
        }

        arch::pause();
    }

    PANIC("GICv3: redistributor did not wake up");
}

void GicV3::wait_for_rwp(MMIORegion& rd) {
    for (uint32_t spins = 0; spins < GIC_RWP_TIMEOUT; ++spins) {
        if (!(rd.read<uint32_t>(GICR_CTLR) & GICR_CTLR_RWP)) {
            return;
        }

        arch::pause();
    }

    LOG_ERROR("GICR: register write still pending after %u polls", GIC_RWP_TIMEOUT);
}

void GicV3::per_cpu_init() {
    uint32_t affinity = affinity_of(this->sysregs.read(SysReg::MpidrEl1));
    MMIORegion rd;

    if (!this->find_redistributor(affinity, rd)) {
        PANIC("GICv3: no redistributor for affinity 0x%x", affinity);
    }

    {
        LockGuard guard(this->cpus_lock);

        uint32_t count = this->num_cpus.load(std::memory_order_relaxed);
        bool known     = false;

        for (uint32_t i = 0; i < count; ++i) {
            known |= this->cpus[i].affinity == affinity;
        }

        if (!known) {
            if (count >= MAX_CPUS) {
                PANIC("GICv3: more than %u cores", MAX_CPUS);
            }

            this->cpus[count] = {affinity, rd};
            this->num_cpus.store(count + 1, std::memory_order_release);
        }
    }

    this->wake_redistributor(rd);

    // Banked SGIs and PPIs: Group 1, PPIs disabled and level-triggered,
    // SGIs enabled for inter-processor signalling.
    rd.write<uint32_t>(GICR_IGROUPR0, 0xFFFFFFFF);
    rd.write<uint32_t>(GICR_ICENABLER0, 0xFFFF0000);
    rd.write<uint32_t>(GICR_ICPENDR0, 0xFFFFFFFF);
    rd.write<uint32_t>(GICR_ICACTIVER0, 0xFFFFFFFF);
    rd.write<uint32_t>(GICR_ICFGR1, 0);

    for (uint32_t i = 0; i < IntId::SPI_START; i += 4) {
        rd.write<uint32_t>(GICR_IPRIORITYR0 + i, GIC_DEFAULT_PRIORITY * 0x01010101u);
    }

    this->wait_for_rwp(rd);
    rd.write<uint32_t>(GICR_ISENABLER0, 0x0000FFFF);

    // CPU interface through system registers, EOImode 0: a write to
    // ICC_EOIR1_EL1 both drops priority and deactivates.
    uint64_t sre = this->sysregs.read(SysReg::IccSreEl1);
    this->sysregs.write(SysReg::IccSreEl1, sre | ICC_SRE_EL1_SRE);
    this->sysregs.isb();

    this->sysregs.write(SysReg::IccPmrEl1, GIC_PRIORITY_MASK_ALL);
    this->sysregs.write(SysReg::IccBpr1El1, 0);
    this->sysregs.write(SysReg::IccCtlrEl1, 0);
    this->sysregs.write(SysReg::IccIgrpen1El1, ICC_IGRPEN1_EL1_ENABLE);
    this->sysregs.isb();

    LOG_INFO("GICv3: CPU interface enabled for affinity 0x%x", affinity);
}

void GicV3::set_trigger(IntId intid, TriggerMode trigger) {
    if (intid.is_sgi()) {
        LOG_WARN("GICv3: ignoring trigger change for SGI %u", intid.index());
        return;
    }

    if (intid.is_ppi()) {
        MMIORegion rd = this->current_redistributor();
        write_icfgr(rd, GICR_ICFGR0, intid, trigger);
        return;
    }

    this->dist.set_trigger(intid, trigger);
}

void GicV3::enable_interrupt(IntId intid) {
    if (intid.is_private()) {
        MMIORegion rd = this->current_redistributor();
        rd.write<uint32_t>(GICR_ISENABLER0, 1u << intid.raw());
        return;
    }

    this->dist.enable(intid);
}

void GicV3::disable_interrupt(IntId intid) {
    if (intid.is_private()) {
        MMIORegion rd = this->current_redistributor();
        rd.write<uint32_t>(GICR_ICENABLER0, 1u << intid.raw());
        this->wait_for_rwp(rd);
        return;
    }

    this->dist.disable(intid);
}

std::optional<IntId> GicV3::get_and_acknowledge_interrupt() {
    IntId intid(static_cast<uint32_t>(this->sysregs.read(SysReg::IccIar1El1) & ICC_IAR1_EL1_INTID));

    if (intid.is_special()) {
        return std::nullopt;
    }

    return intid;
}

void GicV3::end_interrupt(IntId intid) {
    this->sysregs.write(SysReg::IccEoir1El1, intid.raw());
    this->sysregs.isb();
}

void GicV3::send_sgi(IntId intid, SgiTarget target, uint64_t target_mpidr) {
    if (!intid.is_sgi()) {
        PANIC("GICv3: send_sgi with non-SGI INTID %u", intid.raw());
    }

    uint64_t sgi1r = static_cast<uint64_t>(intid.raw()) << ICC_SGI1R_INTID_SHIFT;

    if (target == SgiTarget::AllOthers) {
        sgi1r |= ICC_SGI1R_IRM;
    } else {
        uint64_t mpidr =
            target == SgiTarget::Self ? this->sysregs.read(SysReg::MpidrEl1) : target_mpidr;

        if (mpidr_aff(mpidr, 0) >= 16) {
            PANIC("GICv3: Aff0 %u not addressable by an SGI target list",
                  static_cast<unsigned>(mpidr_aff(mpidr, 0)));
        }

        sgi1r |= mpidr_aff(mpidr, 3) << ICC_SGI1R_AFF3_SHIFT;
        sgi1r |= mpidr_aff(mpidr, 2) << ICC_SGI1R_AFF2_SHIFT;
        sgi1r |= mpidr_aff(mpidr, 1) << ICC_SGI1R_AFF1_SHIFT;
        sgi1r |= 1ull << mpidr_aff(mpidr, 0);
    }

    this->sysregs.write(SysReg::IccSgi1rEl1, sgi1r);
    this->sysregs.isb();

    LOG_DEBUG("GICv3: SGI %u sent (sgi1r=0x%lx)", intid.raw(), static_cast<unsigned long>(sgi1r));
}
}  // namespace gic::hal
