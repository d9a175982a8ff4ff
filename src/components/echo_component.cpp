#include "devicehost/components/echo_component.hpp"

#include <stdexcept>

namespace devicehost::components {

EchoComponent::EchoComponent(component::ComponentContext context)
    : Component(std::move(context)), state_(std::make_shared<EchoState>()) {}

void EchoComponent::on_start() {
    if (!bus()) {
        throw std::runtime_error("Echo component needs a message bus");
    }

    const std::string input = input_channel(output_channel());
    std::weak_ptr<bus::IMessageBus> weak_bus = bus();
    subscription_ = bus()->subscribe(
        input, [weak_bus, output = output_channel(),
                state = state_](const message::Message& message) {
            if (!state->active) {
                return;
            }
            if (auto target = weak_bus.lock()) {
                target->publish(output, message);
                ++state->echoed;
            }
        });

    DEVICEHOST_SLOG_INFO(logger()) << "Listening on " << input;
}

void EchoComponent::on_stop() {
    state_->active = false;
    if (subscription_) {
        bus()->unsubscribe(*subscription_);
        subscription_.reset();
    }
    DEVICEHOST_SLOG_INFO(logger())
        << "Echoed " << state_->echoed << " messages";
}

}  // namespace devicehost::components
