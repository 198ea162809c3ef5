#pragma once

#include <mutex>
#include <type_traits>
#include <utility>

namespace concurrent {

// Value accessible only under its mutex
template <class T>
class MutexedValue {
    std::mutex mtx_;
    T value_;

public:
    using value_type = T;

    template <class... Args>
    explicit MutexedValue(Args&&... args) : value_(std::forward<Args>(args)...) {}

    MutexedValue(const MutexedValue&) = delete;
    MutexedValue(MutexedValue&&) = delete;
    MutexedValue& operator=(const MutexedValue&) = delete;
    MutexedValue& operator=(MutexedValue&&) = delete;
    ~MutexedValue() = default;

    template <class Func>
    auto perform(Func&& operation) {
        static_assert(std::is_invocable_v<Func&&, T&>);
        std::lock_guard guard(mtx_);
        return std::forward<Func>(operation)(value_);
    }
};

} // namespace concurrent
