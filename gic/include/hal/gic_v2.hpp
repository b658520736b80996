#pragma once

#include <cstdint>
#include "hal/gic_dist.hpp"
#include "hal/interface/gic.hpp"
#include "hal/mmio.hpp"

namespace gic::hal {
/**
 * @brief GICv2 backend: memory-mapped distributor and CPU interface.
 *
 * The CPU interface and SGI/PPI distributor registers are banked: the same
 * addresses reach the calling core's copy, so one instance serves every
 * core. Up to eight cores are addressable.
 *
 * SGIs report their source core in GICC_IAR, and GICC_EOIR must be written
 * with the same source. The backend remembers it per (core, SGI) between
 * acknowledge and end.
 */
class GicV2 : public IGenericGic {
   public:
    static constexpr uint32_t MAX_CPUS = 8;

    GicV2(MMIORegion gicd, MMIORegion gicc);

    void init_primary() override;
    void per_cpu_init() override;

    void set_trigger(IntId intid, TriggerMode trigger) override;
    void enable_interrupt(IntId intid) override;
    void disable_interrupt(IntId intid) override;

    std::optional<IntId> get_and_acknowledge_interrupt() override;
    void end_interrupt(IntId intid) override;

    const char* name() const override {
        return "GICv2";
    }

    /// Raise an SGI. @p cpu_list is a bitmask of CPU interfaces and is only
    /// used with SgiTarget::List.
    void send_sgi(IntId intid, SgiTarget target, uint8_t cpu_list = 0);

    uint32_t max_irq() const {
        return this->dist.max_irq();
    }

   private:
    /// CPU interface number of the calling core, from the banked
    /// GICD_ITARGETSR0 byte.
    uint32_t current_cpu_interface() const;

    GicDistributor dist;
    MMIORegion gicc;

    uint8_t sgi_source[MAX_CPUS][IntId::SGI_COUNT] = {};
};
}  // namespace gic::hal
