#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "hal/interface/gic.hpp"

namespace gic::hal {
/// One interrupt line as a board description names it: class-relative
/// index plus class, and how the line is sampled.
struct IrqWiring {
    uint32_t index;
    InterruptType type;
    TriggerMode trigger;
};

/// INTID of @p wiring, or nothing when the index is out of range.
std::optional<IntId> resolve_wiring(const IrqWiring& wiring);

/**
 * @brief Decode an `interrupts` specifier of an "arm,gic*" node.
 *
 * Accepts 3 cells (type, number, flags) or 4 cells (the fourth is a PPI
 * partition phandle, ignored). Type 0 is an SPI, type 1 a PPI. The low
 * nibble of flags selects the trigger: 1 or 2 edge, 4 or 8 level.
 * Anything else (extended ranges, missing trigger flags) yields nothing.
 */
std::optional<IrqWiring> decode_dt_interrupt(const uint32_t* cells, size_t count);

/// Set the trigger of and enable every line in @p table. Invalid entries
/// are logged and skipped. Returns the number of lines configured.
size_t apply_wiring(IGenericGic& gic, const IrqWiring* table, size_t count);
}  // namespace gic::hal
