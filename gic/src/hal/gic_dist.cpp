#include "hal/gic_dist.hpp"
#include "internal/gic_dist.h"
#include "arch.hpp"
#include "libs/log.hpp"

namespace gic::hal {
GicDistributor::GicDistributor(MMIORegion regs) : regs(regs) {}

void GicDistributor::reset() {
    if (!this->regs.valid()) {
        PANIC("GICD: distributor register window not mapped");
    }

    this->write(GICD_CTLR, 0);
    this->wait_for_rwp();

    // ITLinesNumber: the distributor implements 32 * (N + 1) INTIDs.
    uint32_t typer = this->read(GICD_TYPER);
    uint32_t count = ((typer & GICD_TYPER_IT_LINES) + 1) * 32;

    this->lines = count > IntId::GIC_MAX_IRQ ? IntId::GIC_MAX_IRQ : count;

    // Word 0 of every bank covers the banked SGIs/PPIs, which are owned by
    // per-core initialization.
    for (uint32_t i = IntId::SPI_START; i < this->lines; i += 32) {
        size_t word = (i / 32) * 4;

        this->write(GICD_ICENABLER + word, 0xFFFFFFFF);
        this->write(GICD_ICPENDR + word, 0xFFFFFFFF);
        this->write(GICD_ICACTIVER + word, 0xFFFFFFFF);
    }

    for (uint32_t i = IntId::SPI_START; i < this->lines; i += 16) {
        this->write(GICD_ICFGR + (i / 16) * 4, 0);
    }

    for (uint32_t i = IntId::SPI_START; i < this->lines; i += 4) {
        this->write(GICD_IPRIORITYR + i, GIC_DEFAULT_PRIORITY * 0x01010101u);
    }

    this->wait_for_rwp();

    LOG_INFO("GICD: %u interrupt lines, SPIs [%u, %u) quiesced", this->lines, IntId::SPI_START,
             this->lines);
}

void GicDistributor::enable_forwarding(uint32_t ctlr) {
    this->write(GICD_CTLR, ctlr);
    this->wait_for_rwp();

    LOG_DEBUG("GICD: forwarding enabled (ctlr=0x%x)", ctlr);
}

void GicDistributor::check_implemented(IntId intid, const char* op) const {
    if (intid.raw() >= this->lines) {
        char name[32];
        intid.format(name, sizeof(name));

        if (this->lines == 0) {
            PANIC("GICD: %s(%s) before init_primary", op, name);
        }

        PANIC("GICD: %s(%s) above implemented maximum %u", op, name, this->lines);
    }
}

void GicDistributor::set_trigger(IntId intid, TriggerMode trigger) {
    this->check_implemented(intid, "set_trigger");

    LockGuard guard(this->config_lock);
    write_icfgr(this->regs, GICD_ICFGR, intid, trigger);
}

void GicDistributor::enable(IntId intid) {
    this->check_implemented(intid, "enable");

    // Set-enable registers are write-1-to-set: no read-modify-write, and
    // enabling an already enabled INTID changes nothing.
    this->write(GICD_ISENABLER + (intid.raw() / 32) * 4, 1u << (intid.raw() % 32));
}

void GicDistributor::disable(IntId intid) {
    this->check_implemented(intid, "disable");

    this->write(GICD_ICENABLER + (intid.raw() / 32) * 4, 1u << (intid.raw() % 32));
    this->wait_for_rwp();
}

void GicDistributor::wait_for_rwp() {
    for (uint32_t spins = 0; spins < GIC_RWP_TIMEOUT; ++spins) {
        if (!(this->read(GICD_CTLR) & GICD_CTLR_RWP)) {
            return;
        }

        arch::pause();
    }

    LOG_ERROR("GICD: register write still pending after %u polls", GIC_RWP_TIMEOUT);
}

void write_icfgr(MMIORegion& regs, size_t icfgr_base, IntId intid, TriggerMode trigger) {
    size_t offset  = icfgr_base + (intid.raw() / 16) * 4;
    uint32_t shift = (intid.raw() % 16) * 2;

    uint32_t val = regs.read<uint32_t>(offset);

    if (trigger == TriggerMode::Edge) {
        val |= GICD_ICFGR_EDGE << shift;
    } else {
        val &= ~(GICD_ICFGR_EDGE << shift);
    }

    regs.write<uint32_t>(offset, val);

    LOG_DEBUG("GIC: INTID %u set %s-triggered", intid.raw(), trigger_mode_name(trigger));
}
}  // namespace gic::hal
