#include "devicehost/component/signal.hpp"

namespace devicehost::component {

void Signal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

bool Signal::is_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_;
}

void Signal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return set_; });
}

bool Signal::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_; });
}

}  // namespace devicehost::component
