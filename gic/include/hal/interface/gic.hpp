#pragma once

#include <optional>
#include "hal/intid.hpp"

namespace gic::hal {
/**
 * @brief Version-independent interface every GIC backend provides.
 *
 * Each interrupt ID cycles through a state machine held by the hardware:
 *
 *   Inactive -> Pending   the source asserts while the ID is enabled
 *   Pending  -> Active    get_and_acknowledge_interrupt() on the target core
 *   Active   -> Inactive  end_interrupt()
 *   Active   -> Pending   end_interrupt() while a level source is still
 *                         asserted (or a new edge arrived meanwhile)
 *
 * Every ID starts Inactive and the cycle has no terminal state.
 *
 * Calling discipline:
 *  - init_primary() runs exactly once, on one core, before any other call.
 *    Callers serialize it against everything else.
 *  - per_cpu_init() runs once on every core, after init_primary() returned
 *    and before that core services interrupts.
 *  - set_trigger()/enable_interrupt()/disable_interrupt() on the same SPI
 *    from several cores must be serialized by the caller. SGIs and PPIs are
 *    banked per core and configure the calling core only.
 *  - Every ID returned by get_and_acknowledge_interrupt() is passed to
 *    end_interrupt() exactly once, on the same core, after the device has
 *    been serviced (for level sources: after the line was cleared). Ending
 *    an ID that is not the core's most recently acknowledged one, or ending
 *    it twice, is undefined and backend-specific.
 *
 * Touching an ID at or above the implemented maximum is a caller error and
 * panics. No operation blocks or fails softly: register access is assumed
 * to work.
 */
class IGenericGic {
   public:
    virtual ~IGenericGic() = default;

    /// Initialises the distributor: every SPI disabled, inactive and
    /// level-triggered, then forwarding enabled.
    virtual void init_primary() = 0;

    /// Initialises the GIC for the calling CPU core. The core's PPIs are
    /// left disabled. Its SGIs are the one exception to masking by
    /// default: they come out enabled, so inter-processor signalling
    /// works without an enable_interrupt() per SGI.
    virtual void per_cpu_init() = 0;

    /// Configures the trigger type for the interrupt with the given ID.
    /// Must not be called while the ID is pending or active.
    virtual void set_trigger(IntId intid, TriggerMode trigger) = 0;

    /// Enables the interrupt with the given ID. Idempotent.
    virtual void enable_interrupt(IntId intid) = 0;

    /// Disables the interrupt with the given ID. Assertions that happen
    /// while disabled are not delivered; lost edges stay lost. Idempotent.
    virtual void disable_interrupt(IntId intid) = 0;

    /// Gets the ID of the highest priority signalled interrupt, and
    /// acknowledges it. Returns nothing if no interrupt is pending.
    /// Never blocks, safe to poll.
    virtual std::optional<IntId> get_and_acknowledge_interrupt() = 0;

    /// Informs the interrupt controller that the CPU has completed
    /// processing the given interrupt. This drops the running priority and
    /// deactivates the interrupt.
    virtual void end_interrupt(IntId intid) = 0;

    virtual const char* name() const = 0;
};
}  // namespace gic::hal
