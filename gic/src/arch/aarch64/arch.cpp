/**
 * @file arch.cpp
 * @brief aarch64 CPU control helpers used by the GIC layer.
 */

#include <cstdint>
#include "arch.hpp"

namespace gic::arch {
void halt(bool interrupts) {
    // There is no return from this function.
    while (true) {
        if (!interrupts) {
            // Mask IRQ and FIQ so nothing wakes the core back into a handler.
            asm volatile("msr daifset, #3" ::: "memory");
        }

        asm volatile("wfi");
    }
}

void pause() {
    asm volatile("yield");
}

void disable_interrupts() {
    asm volatile("msr daifset, #2" ::: "memory");
}

void enable_interrupts() {
    asm volatile("msr daifclr, #2" ::: "memory");
}

bool interrupt_status() {
    uint64_t daif = 0;
    asm volatile("mrs %0, daif" : "=r"(daif));

    // DAIF.I (bit 7) set means IRQs are masked.
    return !(daif & (1ul << 7));
}

void io_barrier() {
    asm volatile("dsb sy" ::: "memory");
}
}  // namespace gic::arch
