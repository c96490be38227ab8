#include "conduit/slot_pool.hpp"

#include <algorithm>
#include <stdexcept>

namespace conduit {

    void concurrency_slot::release() {
        if (pool_ != nullptr) {
            auto* pool = pool_;
            pool_ = nullptr;
            pool->give_back();
        }
    }

    slot_pool::slot_pool(std::size_t capacity) : capacity_{capacity} {
        if (capacity_ == 0) {
            throw std::invalid_argument{"slot_pool capacity must be at least 1"};
        }
    }

    slot_acquisition slot_pool::acquire(std::chrono::steady_clock::time_point deadline, std::stop_token stop) {
        std::unique_lock lock{mutex_};
        auto ticket = next_ticket_++;
        queue_.push_back(ticket);

        bool granted = cv_.wait_until(
                lock, stop, deadline, [&] { return queue_.front() == ticket && in_use_ < capacity_; });

        if (granted) {
            queue_.pop_front();
            ++in_use_;
            peak_ = std::max(peak_, in_use_);
            // the next waiter may also fit
            lock.unlock();
            cv_.notify_all();
            return {.status = acquire_status::acquired, .slot = concurrency_slot{this}};
        }

        bool was_head = queue_.front() == ticket;
        std::erase(queue_, ticket);
        auto status = stop.stop_requested() ? acquire_status::cancelled : acquire_status::timed_out;
        lock.unlock();
        if (was_head) {
            cv_.notify_all();
        }
        return {.status = status};
    }

    void slot_pool::give_back() {
        {
            std::lock_guard lock{mutex_};
            --in_use_;
        }
        cv_.notify_all();
    }

    std::size_t slot_pool::in_use() const {
        std::lock_guard lock{mutex_};
        return in_use_;
    }

    std::size_t slot_pool::waiting() const {
        std::lock_guard lock{mutex_};
        return queue_.size();
    }

    std::size_t slot_pool::peak_in_use() const {
        std::lock_guard lock{mutex_};
        return peak_;
    }

}  // namespace conduit
