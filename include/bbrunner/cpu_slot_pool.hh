#pragma once

#include <bbrunner/concurrent/bounded_queue.hh>
#include <bbrunner/logger.hh>
#include <cstdint>
#include <exception>
#include <utility>

namespace bbrunner {

// Slots 0, 1, ..., num_slots - 1, each held by at most one request at a time
class CpuSlotPool {
    concurrent::BoundedQueue<uint32_t> free_slots_;

public:
    explicit CpuSlotPool(uint32_t num_slots) : free_slots_{num_slots} {
        for (uint32_t slot = 0; slot < num_slots; ++slot) {
            free_slots_.push(slot);
        }
    }

    // Returns the slot to the pool on destruction
    class Lease {
        CpuSlotPool* pool_;
        uint32_t slot_;

        Lease(CpuSlotPool& pool, uint32_t slot) noexcept : pool_{&pool}, slot_{slot} {}

        friend class CpuSlotPool;

    public:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        Lease(Lease&& other) noexcept
        : pool_{std::exchange(other.pool_, nullptr)}
        , slot_{other.slot_} {}

        [[nodiscard]] uint32_t slot() const noexcept { return slot_; }

        ~Lease() {
            if (!pool_) {
                return;
            }
            try {
                pool_->free_slots_.push(slot_);
            } catch (const std::exception& e) {
                errlog("cannot return cpu slot ", slot_, ": ", e.what());
            }
        }
    };

    // Blocks until a slot is free
    [[nodiscard]] Lease acquire() { return Lease{*this, free_slots_.pop()}; }
};

} // namespace bbrunner
