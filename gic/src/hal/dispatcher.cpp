#include "hal/dispatcher.hpp"
#include "libs/log.hpp"

namespace gic::hal {
namespace {
void check_registrable(IntId intid) {
    if (intid.is_special()) {
        PANIC("IRQ: cannot install a handler for special INTID %u", intid.raw());
    }
}
}  // namespace

InterruptDispatcher::InterruptDispatcher(IGenericGic& gic) : gic(gic) {
    for (auto& handler : this->handlers) {
        handler.store(nullptr, std::memory_order_relaxed);
    }

    for (auto& word : this->eoi_bitmap) {
        word.store(0, std::memory_order_relaxed);
    }
}

bool InterruptDispatcher::get_eoi(uint32_t id) const {
    const uint32_t word = id / 64;
    const uint32_t bit  = id % 64;

    return this->eoi_bitmap[word].load(std::memory_order_relaxed) & (1ull << bit);
}

void InterruptDispatcher::set_eoi(uint32_t id) {
    const uint32_t word = id / 64;
    const uint32_t bit  = id % 64;

    this->eoi_bitmap[word].fetch_or(1ull << bit, std::memory_order_relaxed);
}

void InterruptDispatcher::clear_eoi(uint32_t id) {
    const uint32_t word = id / 64;
    const uint32_t bit  = id % 64;

    this->eoi_bitmap[word].fetch_and(~(1ull << bit), std::memory_order_relaxed);
}

void InterruptDispatcher::register_handler(IntId intid, IInterruptHandler* handler,
                                           bool eoi_first) {
    check_registrable(intid);

    LockGuard guard(this->lock);

    if (eoi_first) {
        this->set_eoi(intid.raw());
    } else {
        this->clear_eoi(intid.raw());
    }

    this->handlers[intid.raw()].store(handler, std::memory_order_release);

    LOG_INFO("IRQ: registered handler '%s' for INTID %u", handler ? handler->name() : "<null>",
             intid.raw());
}

void InterruptDispatcher::unregister_handler(IntId intid) {
    check_registrable(intid);

    LockGuard guard(this->lock);

    IInterruptHandler* old =
        this->handlers[intid.raw()].exchange(nullptr, std::memory_order_acq_rel);
    this->clear_eoi(intid.raw());

    LOG_INFO("IRQ: unregistered handler '%s' for INTID %u", old ? old->name() : "<null>",
             intid.raw());
}

std::optional<IntId> InterruptDispatcher::map_irq(uint32_t index, InterruptType type,
                                                  TriggerMode trigger,
                                                  IInterruptHandler* handler, bool eoi_first) {
    std::optional<uint32_t> raw = translate_irq(index, type);

    if (!raw) {
        LOG_WARN("IRQ: %s %u does not exist, not mapped", interrupt_type_name(type), index);
        return std::nullopt;
    }

    IntId intid(*raw);

    // The handler goes in first so the line has somewhere to go once
    // it is unmasked.
    this->register_handler(intid, handler, eoi_first);

    if (!intid.is_sgi()) {
        this->gic.set_trigger(intid, trigger);
    }

    this->gic.enable_interrupt(intid);

    LOG_INFO("IRQ: mapped %s %u -> INTID %u (%s)", interrupt_type_name(type), index, intid.raw(),
             trigger_mode_name(trigger));

    return intid;
}

void InterruptDispatcher::unmap_irq(IntId intid) {
    this->gic.disable_interrupt(intid);
    this->unregister_handler(intid);

    LOG_INFO("IRQ: unmapped INTID %u", intid.raw());
}

IInterruptHandler* InterruptDispatcher::handler_for(IntId intid) const {
    if (intid.is_special()) {
        return nullptr;
    }

    return this->handlers[intid.raw()].load(std::memory_order_acquire);
}

DispatchResult InterruptDispatcher::dispatch() {
    std::optional<IntId> pending = this->gic.get_and_acknowledge_interrupt();

    if (!pending) {
        return DispatchResult::Idle;
    }

    const IntId intid      = *pending;
    IInterruptHandler* irq = this->handler_for(intid);

    if (!irq) {
        // No driver claims the line. Mask it so a level source cannot storm.
        char desc[32];
        intid.format(desc, sizeof(desc));
        LOG_WARN("IRQ: no handler for %s (INTID %u), masking", desc, intid.raw());

        this->gic.disable_interrupt(intid);
        this->gic.end_interrupt(intid);

        return DispatchResult::Handled;
    }

    const bool eoi_first = this->get_eoi(intid.raw());

    if (eoi_first) {
        this->gic.end_interrupt(intid);
    }

    IrqStatus status = irq->handle(intid);

    if (status == IrqStatus::Unhandled) {
        PANIC("IRQ: '%s' did not handle INTID %u", irq->name(), intid.raw());
    }

    if (!eoi_first) {
        this->gic.end_interrupt(intid);
    }

    if (status == IrqStatus::Reschedule) {
        LOG_DEBUG("IRQ: INTID %u requested reschedule", intid.raw());
        return DispatchResult::Reschedule;
    }

    return DispatchResult::Handled;
}
}  // namespace gic::hal
