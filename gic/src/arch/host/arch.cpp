#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include "arch.hpp"

namespace gic::arch {
namespace {
// Emulates the per-core IRQ mask bit; every host thread plays one core.
thread_local bool irqs_enabled = true;
}  // namespace

void halt(bool) {
    // A halted core has no hosted equivalent other than ending the process.
    std::fflush(stdout);
    std::abort();
}

void pause() {
    std::this_thread::yield();
}

void disable_interrupts() {
    irqs_enabled = false;
}

void enable_interrupts() {
    irqs_enabled = true;
}

bool interrupt_status() {
    return irqs_enabled;
}

void io_barrier() {
    std::atomic_thread_fence(std::memory_order_seq_cst);
}
}  // namespace gic::arch
