#pragma once

#include <bbrunner/concurrent/mutexed_value.hh>
#include <bbrunner/concurrent/semaphore.hh>
#include <climits>
#include <deque>
#include <utility>

namespace concurrent {

// Multi-producer multi-consumer queue; push() blocks while the queue is full and pop() blocks
// while it is empty
template <class Elem>
class BoundedQueue {
    Semaphore free_slots_;
    Semaphore queued_elems_{0};
    MutexedValue<std::deque<Elem>> elems_;

public:
    explicit BoundedQueue(unsigned max_size = SEM_VALUE_MAX) : free_slots_(max_size) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;
    ~BoundedQueue() = default;

    Elem pop() {
        queued_elems_.wait();
        auto elem = elems_.perform([](auto& elems) {
            Elem res = std::move(elems.front());
            elems.pop_front();
            return res;
        });
        free_slots_.post();
        return elem;
    }

    template <class... Args>
    void push(Args&&... args) {
        free_slots_.wait();
        elems_.perform([&](auto& elems) { elems.emplace_back(std::forward<Args>(args)...); });
        queued_elems_.post();
    }
};

} // namespace concurrent
