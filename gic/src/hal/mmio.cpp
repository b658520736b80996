#include "hal/mmio.hpp"
#include "libs/log.hpp"

namespace gic::hal {
MMIORegion::MMIORegion(uintptr_t virt_base, size_t size) : virt_base(virt_base), size(size) {
    if (!virt_base) {
        LOG_ERROR("MMIO: null register window (size=0x%zx)", size);
        return;
    }

    LOG_DEBUG("MMIO: register window virt=0x%lx size=0x%zx", static_cast<unsigned long>(virt_base),
              size);
}

MMIORegion MMIORegion::slice(size_t offset, size_t length) const {
    if (offset + length > this->size) {
        PANIC("MMIO: slice [0x%zx, 0x%zx) outside window of size 0x%zx", offset, offset + length,
              this->size);
    }

    return MMIORegion(this->virt_base + offset, length);
}
}  // namespace gic::hal
