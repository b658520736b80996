#pragma once

#include <cstdint>
#include "hal/intid.hpp"
#include "hal/mmio.hpp"
#include "libs/spinlock.hpp"

namespace gic::hal {
/// Destination selector for raising an SGI.
enum class SgiTarget : uint8_t {
    List,       // cores named by the caller
    AllOthers,  // every core except the sender
    Self,       // the sending core only
};

/**
 * @brief Distributor registers shared by the GICv2 and GICv3 backends.
 *
 * Owns SPI configuration: enable masks, pending/active clearing, trigger
 * mode and the uniform default priority. Trigger and priority words pack
 * several INTIDs each, so their read-modify-write cycles run under a lock.
 */
class GicDistributor {
   public:
    GicDistributor() = default;
    explicit GicDistributor(MMIORegion regs);

    GicDistributor(const GicDistributor&)            = delete;
    GicDistributor& operator=(const GicDistributor&) = delete;

    /// Disable forwarding and put every SPI into the quiescent state:
    /// disabled, not pending, not active, level-triggered, default priority.
    void reset();

    /// Switch forwarding on with the backend-specific control bits.
    void enable_forwarding(uint32_t ctlr);

    void set_trigger(IntId intid, TriggerMode trigger);
    void enable(IntId intid);
    void disable(IntId intid);

    /// Number of implemented INTIDs (from GICD_TYPER, capped at 1020).
    /// Zero until reset() ran.
    uint32_t max_irq() const {
        return this->lines;
    }

    /// Panic unless @p intid is below max_irq().
    void check_implemented(IntId intid, const char* op) const;

    /// Poll GICD_CTLR.RWP (GICv3) until earlier writes took effect.
    void wait_for_rwp();

    uint32_t read(size_t offset) const {
        return this->regs.read<uint32_t>(offset);
    }

    void write(size_t offset, uint32_t value) {
        this->regs.write<uint32_t>(offset, value);
    }

    MMIORegion& region() {
        return this->regs;
    }

   private:
    MMIORegion regs;
    uint32_t lines = 0;
    IrqLock config_lock;
};

/**
 * @brief Program the two-bit trigger field of @p intid in an ICFGR bank.
 *
 * Shared by the distributor (SPIs) and the GICv3 redistributor (PPIs).
 * @p icfgr_base is the offset of the first ICFGR word covering INTID 0.
 */
void write_icfgr(MMIORegion& regs, size_t icfgr_base, IntId intid, TriggerMode trigger);
}  // namespace gic::hal
