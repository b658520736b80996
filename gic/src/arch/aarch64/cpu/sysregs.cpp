#include "cpu/sysregs.hpp"
#include "libs/log.hpp"

namespace gic::cpu::arch {
using hal::SysReg;

namespace {
// GICv3 CPU interface registers are named by encoding, so older assemblers
// without the ICC_* names still accept them.

uint64_t read_mpidr() {
    uint64_t value;
    asm volatile("mrs %0, mpidr_el1" : "=r"(value));
    return value;
}

uint64_t read_icc_sre() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C12_C12_5" : "=r"(value));
    return value;
}

void write_icc_sre(uint64_t value) {
    asm volatile("msr S3_0_C12_C12_5, %0" ::"r"(value) : "memory");
}

uint64_t read_icc_pmr() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C4_C6_0" : "=r"(value));
    return value;
}

void write_icc_pmr(uint64_t value) {
    asm volatile("msr S3_0_C4_C6_0, %0" ::"r"(value) : "memory");
}

uint64_t read_icc_bpr1() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C12_C12_3" : "=r"(value));
    return value;
}

void write_icc_bpr1(uint64_t value) {
    asm volatile("msr S3_0_C12_C12_3, %0" ::"r"(value) : "memory");
}

uint64_t read_icc_ctlr() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C12_C12_4" : "=r"(value));
    return value;
}

void write_icc_ctlr(uint64_t value) {
    asm volatile("msr S3_0_C12_C12_4, %0" ::"r"(value) : "memory");
}

uint64_t read_icc_igrpen1() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C12_C12_7" : "=r"(value));
    return value;
}

void write_icc_igrpen1(uint64_t value) {
    asm volatile("msr S3_0_C12_C12_7, %0" ::"r"(value) : "memory");
}

uint64_t read_icc_iar1() {
    uint64_t value;
    asm volatile("mrs %0, S3_0_C12_C12_0" : "=r"(value));
    // Keep the acknowledge ordered before any device access made by the
    // handler.
    asm volatile("dsb sy" ::: "memory");
    return value;
}

void write_icc_eoir1(uint64_t value) {
    asm volatile("msr S3_0_C12_C12_1, %0" ::"r"(value) : "memory");
}

void write_icc_sgi1r(uint64_t value) {
    // Device writes made before the SGI must be visible to the target.
    asm volatile("dsb ishst" ::: "memory");
    asm volatile("msr S3_0_C12_C11_5, %0" ::"r"(value) : "memory");
}
}  // namespace

uint64_t SystemRegisters::read(SysReg reg) {
    switch (reg) {
        case SysReg::MpidrEl1:
            return read_mpidr();
        case SysReg::IccSreEl1:
            return read_icc_sre();
        case SysReg::IccPmrEl1:
            return read_icc_pmr();
        case SysReg::IccBpr1El1:
            return read_icc_bpr1();
        case SysReg::IccCtlrEl1:
            return read_icc_ctlr();
        case SysReg::IccIgrpen1El1:
            return read_icc_igrpen1();
        case SysReg::IccIar1El1:
            return read_icc_iar1();
        default:
            PANIC("sysregs: register %u is write-only", static_cast<unsigned>(reg));
    }
}

void SystemRegisters::write(SysReg reg, uint64_t value) {
    switch (reg) {
        case SysReg::IccSreEl1:
            write_icc_sre(value);
            break;
        case SysReg::IccPmrEl1:
            write_icc_pmr(value);
            break;
        case SysReg::IccBpr1El1:
            write_icc_bpr1(value);
            break;
        case SysReg::IccCtlrEl1:
            write_icc_ctlr(value);
            break;
        case SysReg::IccIgrpen1El1:
            write_icc_igrpen1(value);
            break;
        case SysReg::IccEoir1El1:
            write_icc_eoir1(value);
            break;
        case SysReg::IccSgi1rEl1:
            write_icc_sgi1r(value);
            break;
        default:
            PANIC("sysregs: register %u is read-only", static_cast<unsigned>(reg));
    }
}

void SystemRegisters::isb() {
    asm volatile("isb" ::: "memory");
}

SystemRegisters& SystemRegisters::get() {
    static SystemRegisters instance;
    return instance;
}
}  // namespace gic::cpu::arch
