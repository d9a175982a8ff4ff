#include "devicehost/components/heartbeat_component.hpp"

#include <stdexcept>

#include "devicehost/message/messages.hpp"

namespace devicehost::components {

HeartbeatComponent::HeartbeatComponent(component::ComponentContext context)
    : Component(std::move(context)),
      interval_(conf().get<int>("interval_ms", 1000)),
      prefix_(conf().get<std::string>("prefix", "heartbeat")) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Heartbeat interval_ms must be positive");
    }
}

void HeartbeatComponent::run() {
    uint64_t beat = 0;
    while (!wait_for_stop(interval_)) {
        publish(message::TextMessage(prefix_ + " " + std::to_string(++beat)));
    }
    DEVICEHOST_SLOG_DEBUG(logger()) << "Sent " << beat << " heartbeats";
}

}  // namespace devicehost::components
