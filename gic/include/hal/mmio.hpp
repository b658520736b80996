#pragma once

#include <cstddef>
#include <cstdint>

namespace gic::hal {
/**
 * @brief A window of device registers at an already-mapped virtual address.
 *
 * Mapping the controller (device memory attributes, nGnRE) belongs to the
 * embedding kernel; see make_config() in hal/gic.hpp.
 */
class MMIORegion {
   public:
    MMIORegion() : virt_base(0), size(0) {}

    MMIORegion(uintptr_t virt_base, size_t size);

    template <typename T>
    void write(size_t offset, T value) {
        volatile T* addr = reinterpret_cast<volatile T*>(this->virt_base + offset);
        *addr            = value;
    }

    template <typename T>
    T read(size_t offset) const {
        volatile T* addr = reinterpret_cast<volatile T*>(this->virt_base + offset);
        return *addr;
    }

    template <typename T>
    void write_at(size_t index, T val) {
        write<T>(index * sizeof(T), val);
    }

    template <typename T>
    T read_at(size_t index) const {
        return read<T>(index * sizeof(T));
    }

    /// Sub-window starting @p offset bytes into this one.
    MMIORegion slice(size_t offset, size_t length) const;

    bool valid() const {
        return this->virt_base != 0;
    }

    size_t length() const {
        return this->size;
    }

   private:
    uintptr_t virt_base;
    size_t size;
};
}  // namespace gic::hal
