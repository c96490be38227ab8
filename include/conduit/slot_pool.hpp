#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string_view>

namespace conduit {

    using namespace std::string_view_literals;

    class slot_pool;

    enum class acquire_status : uint8_t { acquired, timed_out, cancelled };

    inline constexpr std::string_view to_string(acquire_status status) {
        switch (status) {
            case acquire_status::acquired:
                return "acquired"sv;
            case acquire_status::timed_out:
                return "timed_out"sv;
            case acquire_status::cancelled:
                return "cancelled"sv;
        }
        return "cancelled"sv;
    }

    // Move-only permit; releases back to its pool exactly once
    class concurrency_slot {
      public:
        concurrency_slot() = default;
        ~concurrency_slot() { release(); }

        concurrency_slot(const concurrency_slot&) = delete;
        concurrency_slot& operator=(const concurrency_slot&) = delete;

        concurrency_slot(concurrency_slot&& other) noexcept : pool_{other.pool_} { other.pool_ = nullptr; }
        concurrency_slot& operator=(concurrency_slot&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        explicit operator bool() const { return pool_ != nullptr; }

        void release();

      private:
        friend class slot_pool;
        explicit concurrency_slot(slot_pool* pool) : pool_{pool} {}

        slot_pool* pool_{nullptr};
    };

    struct slot_acquisition {
        acquire_status status{acquire_status::cancelled};
        concurrency_slot slot{};
    };

    /*
     * Counting permit pool with first-come-first-served hand-out: a waiter only takes a
     * free slot when it is at the head of the queue, so a late arrival can never overtake
     * an earlier one. Waiters that time out or are cancelled leave the queue without
     * touching the count.
     */
    class slot_pool {
      public:
        explicit slot_pool(std::size_t capacity);

        slot_pool(const slot_pool&) = delete;
        slot_pool& operator=(const slot_pool&) = delete;

        slot_acquisition acquire(std::chrono::steady_clock::time_point deadline, std::stop_token stop = {});

        std::size_t capacity() const { return capacity_; }
        std::size_t in_use() const;
        std::size_t waiting() const;

        // Highest in_use() seen since construction
        std::size_t peak_in_use() const;

      private:
        friend class concurrency_slot;
        void give_back();

        const std::size_t capacity_;

        mutable std::mutex mutex_{};
        std::condition_variable_any cv_{};
        std::deque<std::uint64_t> queue_{};
        std::uint64_t next_ticket_{0};
        std::size_t in_use_{0};
        std::size_t peak_{0};
    };

}  // namespace conduit
