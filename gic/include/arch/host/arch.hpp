#pragma once

// Hosted stand-ins for the aarch64 primitives, used when the library is
// built as a userspace process (unit tests, simulators).
namespace gic::arch {
[[noreturn]] void halt(bool interrupts);
void pause();

void disable_interrupts();
void enable_interrupts();
bool interrupt_status();

void io_barrier();
}  // namespace gic::arch
