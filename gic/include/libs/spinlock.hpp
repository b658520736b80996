#pragma once

#include <atomic>
#include <cstdint>
#include "arch.hpp"

namespace gic {
namespace __details {
enum class LockType : uint8_t {
    Spin,
    SpinIrq,
};

template <LockType type>
class BaseLock;

/// Ticket lock: waiting cores are served in arrival order.
template <>
class BaseLock<LockType::Spin> {
   public:
    constexpr BaseLock() : next_ticket(0), now_serving(0) {}

    BaseLock(const BaseLock&)            = delete;
    BaseLock& operator=(const BaseLock&) = delete;

    void lock() {
        const uint32_t ticket = this->next_ticket.fetch_add(1, std::memory_order_relaxed);

        while (this->now_serving.load(std::memory_order_acquire) != ticket) {
            arch::pause();
        }
    }

    /// Only the owner may call this.
    void unlock() {
        const uint32_t serving = this->now_serving.load(std::memory_order_relaxed);
        this->now_serving.store(serving + 1, std::memory_order_release);
    }

    bool is_locked() const {
        return this->now_serving.load(std::memory_order_relaxed) !=
               this->next_ticket.load(std::memory_order_relaxed);
    }

   private:
    std::atomic<uint32_t> next_ticket;
    std::atomic<uint32_t> now_serving;
};

/**
 * Ticket lock held with local IRQs masked.
 *
 * Distributor words shared by several INTIDs are reprogrammed under this
 * lock, so an IRQ handler on the same core touching the same word cannot
 * deadlock against the writer it interrupted. The IRQ state sampled on
 * entry is stored only once the lock is owned, and restored on release.
 */
template <>
class BaseLock<LockType::SpinIrq> {
   public:
    constexpr BaseLock() : ticket_lock(), irqs_were_enabled(false) {}

    BaseLock(const BaseLock&)            = delete;
    BaseLock& operator=(const BaseLock&) = delete;

    void lock() {
        const bool enabled = arch::interrupt_status();

        if (enabled) {
            arch::disable_interrupts();
        }

        this->ticket_lock.lock();
        this->irqs_were_enabled = enabled;
    }

    void unlock() {
        const bool restore = this->irqs_were_enabled;

        this->ticket_lock.unlock();

        if (restore) {
            arch::enable_interrupts();
        }
    }

    bool is_locked() const {
        return this->ticket_lock.is_locked();
    }

   private:
    BaseLock<LockType::Spin> ticket_lock;
    bool irqs_were_enabled;
};
}  // namespace __details

template <typename Mutex>
class LockGuard {
   public:
    explicit LockGuard(Mutex& m) : m_mutex(&m) {
        this->m_mutex->lock();
    }

    ~LockGuard() {
        this->m_mutex->unlock();
    }

    LockGuard(const LockGuard&)            = delete;
    LockGuard& operator=(const LockGuard&) = delete;

   private:
    Mutex* m_mutex;
};

template <typename Mutex>
LockGuard(Mutex&) -> LockGuard<Mutex>;

using SpinLock = __details::BaseLock<__details::LockType::Spin>;
using IrqLock  = __details::BaseLock<__details::LockType::SpinIrq>;
}  // namespace gic
