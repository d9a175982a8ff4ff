#pragma once

#include <chrono>
#include <string>

#include "devicehost/component/component.hpp"

namespace devicehost::components {

/**
 * Publishes a TextMessage "<prefix> <n>" on its output channel every
 * interval until stopped.
 *
 * conf keys: interval_ms (default 1000), prefix (default "heartbeat").
 */
class HeartbeatComponent : public component::Component {
public:
    explicit HeartbeatComponent(component::ComponentContext context);

    std::chrono::milliseconds interval() const { return interval_; }
    const std::string& prefix() const { return prefix_; }

protected:
    void run() override;

private:
    std::chrono::milliseconds interval_;
    std::string prefix_;
};

}  // namespace devicehost::components
