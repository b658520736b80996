#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include "libs/log.hpp"

namespace gic::hal {
/// Different types of interrupt that the GIC handles.
enum class InterruptType : uint8_t {
    /// Software-generated interrupt, raised by a write to an SGI register.
    /// Typically used for inter-processor signalling.
    SGI,
    /// Private peripheral interrupt, local to one core.
    PPI,
    /// Shared peripheral interrupt, deliverable to any connected core.
    SPI,
};

/// How the controller samples an interrupt line.
enum class TriggerMode : uint8_t {
    /// Asserted on a rising edge and, regardless of the signal afterwards,
    /// stays asserted until consumed by acknowledge/end.
    Edge = 0,
    /// Asserted while the line is active, deasserted when it goes inactive.
    Level = 1,
};

/**
 * @brief A GIC interrupt ID (INTID).
 *
 * The 10-bit INTID space is split into architectural classes:
 *  - [0, 16)     software-generated interrupts (SGI)
 *  - [16, 32)    private peripheral interrupts (PPI)
 *  - [32, 1020)  shared peripheral interrupts (SPI)
 *  - [1020, 1024) special IDs, e.g. 1023 for "nothing pending"
 *
 * The sgi()/ppi()/spi() constructors treat an out-of-range index as a
 * caller bug and panic. The raw constructor accepts any value because IDs
 * read back from the hardware (an IAR read) are taken as they are.
 */
class IntId {
   public:
    /// Maximum number of interrupts supported by the GIC.
    static constexpr uint32_t GIC_MAX_IRQ = 1020;

    static constexpr uint32_t SGI_START     = 0;
    static constexpr uint32_t PPI_START     = 16;
    static constexpr uint32_t SPI_START     = 32;
    static constexpr uint32_t SPECIAL_START = 1020;

    /// INTID reported by an acknowledge read when nothing is pending.
    static constexpr uint32_t SPURIOUS = 1023;

    static constexpr uint32_t SGI_COUNT = PPI_START - SGI_START;
    static constexpr uint32_t PPI_COUNT = SPI_START - PPI_START;
    static constexpr uint32_t SPI_COUNT = SPECIAL_START - SPI_START;

    constexpr explicit IntId(uint32_t raw) : id(raw) {}

    static constexpr IntId sgi(uint32_t n) {
        if (n >= SGI_COUNT) {
            PANIC("IntId: SGI index %u out of range (max %u)", n, SGI_COUNT - 1);
        }

        return IntId(SGI_START + n);
    }

    static constexpr IntId ppi(uint32_t n) {
        if (n >= PPI_COUNT) {
            PANIC("IntId: PPI index %u out of range (max %u)", n, PPI_COUNT - 1);
        }

        return IntId(PPI_START + n);
    }

    static constexpr IntId spi(uint32_t n) {
        if (n >= SPI_COUNT) {
            PANIC("IntId: SPI index %u out of range (max %u)", n, SPI_COUNT - 1);
        }

        return IntId(SPI_START + n);
    }

    constexpr uint32_t raw() const {
        return this->id;
    }

    constexpr explicit operator uint32_t() const {
        return this->id;
    }

    constexpr bool is_sgi() const {
        return this->id < PPI_START;
    }

    constexpr bool is_ppi() const {
        return this->id >= PPI_START && this->id < SPI_START;
    }

    constexpr bool is_spi() const {
        return this->id >= SPI_START && this->id < SPECIAL_START;
    }

    /// SGIs and PPIs are banked per core.
    constexpr bool is_private() const {
        return this->id < SPI_START;
    }

    constexpr bool is_special() const {
        return this->id >= SPECIAL_START;
    }

    /// Class of this ID, or nothing for special IDs.
    std::optional<InterruptType> type() const;

    /// Index relative to the start of this ID's class. Special IDs return
    /// the raw value.
    uint32_t index() const;

    /**
     * @brief Render "SGI n", "PPI n", "SPI n" or "Special IntId N".
     *
     * Diagnostic only. Behaves like snprintf: returns the length the full
     * text needs, and always NUL-terminates when @p size is non-zero.
     */
    int format(char* buf, size_t size) const;

    constexpr auto operator<=>(const IntId&) const = default;

   private:
    uint32_t id;
};

/// Translate an interrupt of a given type to a GIC INTID.
///
/// Fallible counterpart of IntId::sgi/ppi/spi for indices that come from
/// configuration or firmware tables: out-of-range input yields nothing.
std::optional<uint32_t> translate_irq(uint32_t id, InterruptType type);

const char* interrupt_type_name(InterruptType type);
const char* trigger_mode_name(TriggerMode mode);
}  // namespace gic::hal
