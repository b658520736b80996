#pragma once

#include "hal/interface/sysregs.hpp"

namespace gic::cpu::arch {
/// ISystemRegisters backed by mrs/msr on the executing core.
class SystemRegisters : public hal::ISystemRegisters {
   public:
    uint64_t read(hal::SysReg reg) override;
    void write(hal::SysReg reg, uint64_t value) override;
    void isb() override;

    static SystemRegisters& get();
};
}  // namespace gic::cpu::arch
