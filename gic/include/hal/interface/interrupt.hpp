#pragma once

#include <cstdint>
#include "hal/intid.hpp"

namespace gic::hal {
enum class IrqStatus : uint8_t {
    Handled,     // no further work needed.
    Unhandled,   // the device did not claim the interrupt
    Reschedule,  // handler unblocked a thread; caller should run its scheduler
};

class IInterruptHandler {
   public:
    virtual ~IInterruptHandler()          = default;
    virtual IrqStatus handle(IntId intid) = 0;
    virtual const char* name() const      = 0;
};
}  // namespace gic::hal
