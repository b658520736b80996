#include "hal/wiring.hpp"
#include "libs/log.hpp"

#define DT_GIC_SPI 0
#define DT_GIC_PPI 1

#define DT_IRQ_TYPE_MASK         0xF
#define DT_IRQ_TYPE_EDGE_RISING  0x1
#define DT_IRQ_TYPE_EDGE_FALLING 0x2
#define DT_IRQ_TYPE_LEVEL_HIGH   0x4
#define DT_IRQ_TYPE_LEVEL_LOW    0x8

namespace gic::hal {
std::optional<IntId> resolve_wiring(const IrqWiring& wiring) {
    std::optional<uint32_t> raw = translate_irq(wiring.index, wiring.type);

    if (!raw) {
        return std::nullopt;
    }

    return IntId(*raw);
}

std::optional<IrqWiring> decode_dt_interrupt(const uint32_t* cells, size_t count) {
    if (count != 3 && count != 4) {
        LOG_WARN("DT: GIC interrupt specifier has %zu cells, expected 3 or 4", count);
        return std::nullopt;
    }

    IrqWiring wiring;
    wiring.index = cells[1];

    switch (cells[0]) {
        case DT_GIC_SPI:
            wiring.type = InterruptType::SPI;
            break;
        case DT_GIC_PPI:
            wiring.type = InterruptType::PPI;
            break;
        default:
            LOG_WARN("DT: unsupported GIC interrupt type %u", cells[0]);
            return std::nullopt;
    }

    switch (cells[2] & DT_IRQ_TYPE_MASK) {
        case DT_IRQ_TYPE_EDGE_RISING:
        case DT_IRQ_TYPE_EDGE_FALLING:
            wiring.trigger = TriggerMode::Edge;
            break;
        case DT_IRQ_TYPE_LEVEL_HIGH:
        case DT_IRQ_TYPE_LEVEL_LOW:
            wiring.trigger = TriggerMode::Level;
            break;
        default:
            LOG_WARN("DT: unsupported GIC interrupt flags 0x%x", cells[2]);
            return std::nullopt;
    }

    if (!resolve_wiring(wiring)) {
        LOG_WARN("DT: %s %u is out of range", interrupt_type_name(wiring.type), wiring.index);
        return std::nullopt;
    }

    return wiring;
}

size_t apply_wiring(IGenericGic& gic, const IrqWiring* table, size_t count) {
    size_t applied = 0;

    for (size_t i = 0; i < count; i++) {
        const IrqWiring& entry     = table[i];
        std::optional<IntId> intid = resolve_wiring(entry);

        if (!intid) {
            LOG_WARN("wiring: entry %zu (%s %u) is out of range, skipped", i,
                     interrupt_type_name(entry.type), entry.index);
            continue;
        }

        // SGIs are edge-triggered by architecture.
        if (!intid->is_sgi()) {
            gic.set_trigger(*intid, entry.trigger);
        }

        gic.enable_interrupt(*intid);
        applied++;

        LOG_DEBUG("wiring: INTID %u enabled, %s-triggered", intid->raw(),
                  trigger_mode_name(entry.trigger));
    }

    LOG_INFO("wiring: %zu of %zu line(s) configured on %s", applied, count, gic.name());

    return applied;
}
}  // namespace gic::hal
