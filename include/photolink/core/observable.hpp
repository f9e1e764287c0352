#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

namespace photolink::core {

// A single current value that can be polled, waited on, or watched by one handler.
template<typename T>
class Observable {
public:
    using ChangeHandler = std::function<void(const T&)>;

    explicit Observable(T initial = T{}) : value_(std::move(initial)) {}

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    T get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    void set(T value) {
        ChangeHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = std::move(value);
            handler = handler_;
        }
        cv_.notify_all();

        // Called outside the lock so the handler may read the value again.
        if (handler) {
            handler(get());
        }
    }

    // Replaces the value only while keep(current) is false. Returns whether it was replaced.
    template<typename Predicate>
    bool set_unless(T value, Predicate keep) {
        ChangeHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (keep(value_)) {
                return false;
            }
            value_ = std::move(value);
            handler = handler_;
        }
        cv_.notify_all();

        if (handler) {
            handler(get());
        }
        return true;
    }

    void set_change_handler(ChangeHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    template<typename Predicate>
    bool wait_for(Predicate predicate, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return predicate(value_); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    T value_;
    ChangeHandler handler_;
};

}
