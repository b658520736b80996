#pragma once

#include "hal/gic.hpp"
#include "uacpi/acpi.h"

namespace gic::hal {
class ACPI {
   public:
    /// Fetch the MADT through uACPI and extract the GIC layout.
    static bool discover_gic(GicPlatformInfo& out);

    /// Walk GICC, GICD and GICR entries of @p madt. Returns false when the
    /// table describes no distributor.
    static bool parse_madt(const acpi_madt* madt, GicPlatformInfo& out);
};
}  // namespace gic::hal
