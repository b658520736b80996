#pragma once

namespace gic::arch {
[[noreturn]] void halt(bool interrupts);
void pause();

void disable_interrupts();
void enable_interrupts();
bool interrupt_status();

/// Full-system barrier ordering device register accesses (DSB SY).
void io_barrier();
}  // namespace gic::arch
