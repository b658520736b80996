// File: tests/support/fake_mmio.hpp
// Purpose: Plain host memory standing in for a device register window.
// Key invariants: Registers behave as RAM; write-1-to-set/clear and
//                 self-clearing bits are not modelled, reads return the last
//                 value written. Status bits (RWP, ChildrenAsleep) read 0.
// Ownership/Lifetime: The window must outlive every MMIORegion made from it.
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>
#include "hal/mmio.hpp"

namespace gic::test {
class FakeMmio {
   public:
    explicit FakeMmio(size_t size) : words((size + 7) / 8, 0), size(size) {}

    hal::MMIORegion region() {
        return hal::MMIORegion(this->base(), this->size);
    }

    uintptr_t base() {
        return reinterpret_cast<uintptr_t>(this->words.data());
    }

    uint32_t read32(size_t offset) const {
        uint32_t value;
        std::memcpy(&value, this->bytes() + offset, sizeof(value));
        return value;
    }

    uint64_t read64(size_t offset) const {
        uint64_t value;
        std::memcpy(&value, this->bytes() + offset, sizeof(value));
        return value;
    }

    uint8_t read8(size_t offset) const {
        return this->bytes()[offset];
    }

    void write32(size_t offset, uint32_t value) {
        std::memcpy(this->bytes() + offset, &value, sizeof(value));
    }

    void write64(size_t offset, uint64_t value) {
        std::memcpy(this->bytes() + offset, &value, sizeof(value));
    }

    void fill(uint8_t value) {
        std::memset(this->words.data(), value, this->words.size() * 8);
    }

   private:
    uint8_t* bytes() {
        return reinterpret_cast<uint8_t*>(this->words.data());
    }

    const uint8_t* bytes() const {
        return reinterpret_cast<const uint8_t*>(this->words.data());
    }

    std::vector<uint64_t> words;
    size_t size;
};
}  // namespace gic::test
