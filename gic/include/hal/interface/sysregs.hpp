#pragma once

#include <cstdint>

namespace gic::hal {
/// AArch64 system registers the GICv3 CPU interface is programmed through.
enum class SysReg : uint8_t {
    MpidrEl1,
    IccSreEl1,
    IccPmrEl1,
    IccBpr1El1,
    IccCtlrEl1,
    IccIgrpen1El1,
    IccIar1El1,   // read-only, reading acknowledges
    IccEoir1El1,  // write-only
    IccSgi1rEl1,  // write-only
};

class ISystemRegisters {
   public:
    virtual ~ISystemRegisters() = default;

    virtual uint64_t read(SysReg reg)              = 0;
    virtual void write(SysReg reg, uint64_t value) = 0;

    /// Context synchronization after writes that change CPU interface state.
    virtual void isb() = 0;
};
}  // namespace gic::hal
