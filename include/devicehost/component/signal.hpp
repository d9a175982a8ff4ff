#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace devicehost::component {

/// @brief One-shot flag that threads can wait on. Once set it stays set.
class Signal {
public:
    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    void set();
    bool is_set() const;

    // Blocks until the signal is set.
    void wait() const;

    // Returns true if the signal was set before the timeout expired.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool set_ = false;
};

}  // namespace devicehost::component
