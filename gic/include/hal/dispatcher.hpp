#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include "hal/interface/gic.hpp"
#include "hal/interface/interrupt.hpp"
#include "libs/spinlock.hpp"

namespace gic::hal {
enum class DispatchResult : uint8_t {
    Idle,        // nothing was pending
    Handled,     // one interrupt acknowledged, serviced and ended
    Reschedule,  // as Handled, and the handler asked for a reschedule
};

/**
 * @brief Routes acknowledged interrupts to registered handlers.
 *
 * The IRQ exception vector calls dispatch(), which performs one full
 * acknowledge -> handle -> end cycle on the controller. With eoi_first set
 * for an ID, end_interrupt() is issued before the handler runs, which lets
 * an edge source fire again while the handler is still executing.
 */
class InterruptDispatcher {
   public:
    explicit InterruptDispatcher(IGenericGic& gic);

    InterruptDispatcher(const InterruptDispatcher&)            = delete;
    InterruptDispatcher& operator=(const InterruptDispatcher&) = delete;

    void register_handler(IntId intid, IInterruptHandler* handler, bool eoi_first = false);
    void unregister_handler(IntId intid);

    /// Translate @p index, configure its trigger, install @p handler and
    /// unmask the line. Returns the INTID, or nothing for an invalid index.
    std::optional<IntId> map_irq(uint32_t index, InterruptType type, TriggerMode trigger,
                                 IInterruptHandler* handler, bool eoi_first = false);

    /// Mask the line and remove its handler.
    void unmap_irq(IntId intid);

    DispatchResult dispatch();

    IInterruptHandler* handler_for(IntId intid) const;

   private:
    static constexpr uint32_t EOI_WORDS = (IntId::GIC_MAX_IRQ + 63) / 64;

    bool get_eoi(uint32_t id) const;
    void set_eoi(uint32_t id);
    void clear_eoi(uint32_t id);

    IGenericGic& gic;

    std::atomic<IInterruptHandler*> handlers[IntId::GIC_MAX_IRQ];
    std::atomic<uint64_t> eoi_bitmap[EOI_WORDS];

    IrqLock lock;
};
}  // namespace gic::hal
