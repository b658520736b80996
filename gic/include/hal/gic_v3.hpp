#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "hal/gic_dist.hpp"
#include "hal/interface/gic.hpp"
#include "hal/interface/sysregs.hpp"
#include "hal/mmio.hpp"
#include "libs/spinlock.hpp"

namespace gic::hal {
/**
 * @brief GICv3/GICv4 backend: distributor, redistributors and the ICC
 * system register CPU interface.
 *
 * Affinity routing is enabled and every INTID lives in Group 1. Each core
 * owns one redistributor frame; per_cpu_init() finds it by matching the
 * core's MPIDR affinity against GICR_TYPER while walking the frames, and
 * remembers it for later SGI/PPI configuration on that core.
 *
 * GICv4 redistributors carry two extra (VLPI) frames; pass the matching
 * stride. Virtual interrupts are not used.
 */
class GicV3 : public IGenericGic {
   public:
    static constexpr size_t GICR_STRIDE_V3 = 0x20000;
    static constexpr size_t GICR_STRIDE_V4 = 0x40000;

    static constexpr uint32_t MAX_CPUS = 256;

    GicV3(MMIORegion gicd, MMIORegion gicr, ISystemRegisters& sysregs,
          size_t gicr_stride = GICR_STRIDE_V3);

    void init_primary() override;
    void per_cpu_init() override;

    void set_trigger(IntId intid, TriggerMode trigger) override;
    void enable_interrupt(IntId intid) override;
    void disable_interrupt(IntId intid) override;

    std::optional<IntId> get_and_acknowledge_interrupt() override;
    void end_interrupt(IntId intid) override;

    const char* name() const override {
        return "GICv3";
    }

    /// Raise an SGI. @p target_mpidr names the destination core and is only
    /// used with SgiTarget::List.
    void send_sgi(IntId intid, SgiTarget target, uint64_t target_mpidr = 0);

    uint32_t max_irq() const {
        return this->dist.max_irq();
    }

    uint32_t online_cpus() const {
        return this->num_cpus.load(std::memory_order_acquire);
    }

   private:
    struct Redistributor {
        uint32_t affinity;
        MMIORegion frame;
    };

    static uint32_t affinity_of(uint64_t mpidr);

    /// Walk the redistributor frames for the one serving @p affinity.
    bool find_redistributor(uint32_t affinity, MMIORegion& out) const;

    /// Frame of the calling core; panics when per_cpu_init() has not run.
    MMIORegion current_redistributor();

    void wake_redistributor(MMIORegion& rd);
    void wait_for_rwp(MMIORegion& rd);

    GicDistributor dist;
    MMIORegion gicr;
    ISystemRegisters& sysregs;
    size_t gicr_stride;

    Redistributor cpus[MAX_CPUS];
    std::atomic<uint32_t> num_cpus{0};
    IrqLock cpus_lock;
};
}  // namespace gic::hal
