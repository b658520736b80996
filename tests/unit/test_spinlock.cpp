// File: tests/unit/test_spinlock.cpp
// Purpose: Ticket spinlock mutual exclusion and the IRQ-masking lock flavour.
// Key invariants: Increments under the lock are never lost; IrqLock masks
//                 local interrupts while held and restores the previous mask
//                 state on release.
// Ownership/Lifetime: Locks are local to each test; host threads play cores.

#include <gtest/gtest.h>

#include <thread>
#include <vector>
#include "arch.hpp"
#include "libs/spinlock.hpp"

using gic::IrqLock;
using gic::LockGuard;
using gic::SpinLock;

TEST(SpinLockTest, SerializesConcurrentIncrements) {
    SpinLock lock;
    uint64_t counter = 0;

    std::vector<std::thread> cores;

    for (int t = 0; t < 4; ++t) {
        cores.emplace_back([&] {
            for (int i = 0; i < 10000; ++i) {
                LockGuard guard(lock);
                counter++;
            }
        });
    }

    for (auto& core : cores) {
        core.join();
    }

    EXPECT_EQ(counter, 40000u);
    EXPECT_FALSE(lock.is_locked());
}

TEST(SpinLockTest, ReportsWhetherItIsHeld) {
    SpinLock lock;

    EXPECT_FALSE(lock.is_locked());

    {
        LockGuard guard(lock);
        EXPECT_TRUE(lock.is_locked());
    }

    EXPECT_FALSE(lock.is_locked());
}

TEST(IrqLockTest, MasksInterruptsWhileHeld) {
    IrqLock lock;

    gic::arch::enable_interrupts();

    {
        LockGuard guard(lock);
        EXPECT_FALSE(gic::arch::interrupt_status());
        EXPECT_TRUE(lock.is_locked());
    }

    EXPECT_TRUE(gic::arch::interrupt_status());
    EXPECT_FALSE(lock.is_locked());
}

TEST(IrqLockTest, LeavesInterruptsMaskedIfTheyWereMasked) {
    IrqLock lock;

    gic::arch::disable_interrupts();

    {
        LockGuard guard(lock);
        EXPECT_FALSE(gic::arch::interrupt_status());
    }

    EXPECT_FALSE(gic::arch::interrupt_status());
    gic::arch::enable_interrupts();
}
