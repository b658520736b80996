#include <stdio.h>
#include "hal/intid.hpp"

namespace gic::hal {
std::optional<InterruptType> IntId::type() const {
    if (this->is_sgi()) {
        return InterruptType::SGI;
    }

    if (this->is_ppi()) {
        return InterruptType::PPI;
    }

    if (this->is_spi()) {
        return InterruptType::SPI;
    }

    return std::nullopt;
}

uint32_t IntId::index() const {
    if (this->id < PPI_START) {
        return this->id - SGI_START;
    } else if (this->id < SPI_START) {
        return this->id - PPI_START;
    } else if (this->id < SPECIAL_START) {
        return this->id - SPI_START;
    }

    return this->id;
}

int IntId::format(char* buf, size_t size) const {
    if (this->is_special()) {
        return snprintf(buf, size, "Special IntId %u", this->id);
    }

    return snprintf(buf, size, "%s %u", interrupt_type_name(*this->type()), this->index());
}

std::optional<uint32_t> translate_irq(uint32_t id, InterruptType type) {
    switch (type) {
        case InterruptType::SGI:
            if (id < IntId::SGI_COUNT) {
                return id + IntId::SGI_START;
            }
            break;
        case InterruptType::PPI:
            if (id < IntId::PPI_COUNT) {
                return id + IntId::PPI_START;
            }
            break;
        case InterruptType::SPI:
            if (id < IntId::SPI_COUNT) {
                return id + IntId::SPI_START;
            }
            break;
    }

    return std::nullopt;
}

const char* interrupt_type_name(InterruptType type) {
    switch (type) {
        case InterruptType::SGI:
            return "SGI";
        case InterruptType::PPI:
            return "PPI";
        case InterruptType::SPI:
            return "SPI";
        default:
            return "?";
    }
}

const char* trigger_mode_name(TriggerMode mode) {
    switch (mode) {
        case TriggerMode::Edge:
            return "edge";
        case TriggerMode::Level:
            return "level";
        default:
            return "?";
    }
}
}  // namespace gic::hal
