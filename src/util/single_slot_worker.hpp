#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <utility>

namespace util {

// One background thread, one task at a time. submit() refuses while a task is in flight;
// join() blocks until the current task has finished.
class SingleSlotWorker {
public:
    SingleSlotWorker() = default;
    ~SingleSlotWorker() { join(); }

    SingleSlotWorker(const SingleSlotWorker&) = delete;
    SingleSlotWorker& operator=(const SingleSlotWorker&) = delete;

    bool submit(std::function<void()> task) {
        bool expected = false;
        if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        thread_ = std::thread([this, t = std::move(task)]() mutable {
            t();
            busy_.store(false, std::memory_order_release);
        });
        return true;
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool busy() const noexcept { return busy_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> busy_{false};
    std::thread thread_;
};

} // namespace util
