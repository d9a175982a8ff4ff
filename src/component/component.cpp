#include "devicehost/component/component.hpp"

#include <stdexcept>

namespace devicehost::component {

Component::Component(ComponentContext context)
    : context_(std::move(context)),
      logger_(context_.component_name, context_.log_level) {
    if (!context_.stop_signal || !context_.ready_signal) {
        throw std::invalid_argument("Component '" + context_.component_name +
                                    "' requires stop and ready signals");
    }
}

void Component::start() {
    DEVICEHOST_SLOG_DEBUG(logger_) << "Starting on " << output_channel();
    on_start();
    context_.ready_signal->set();
    DEVICEHOST_SLOG_INFO(logger_) << "Ready";

    run();

    on_stop();
    DEVICEHOST_SLOG_INFO(logger_) << "Stopped";
}

void Component::run() { context_.stop_signal->wait(); }

bool Component::wait_for_stop(std::chrono::milliseconds timeout) const {
    return context_.stop_signal->wait_for(timeout);
}

void Component::publish(const message::Message& message) {
    if (!context_.bus) {
        DEVICEHOST_SLOG_WARN(logger_)
            << "No bus attached, dropping " << message.type_name();
        return;
    }
    context_.bus->publish(context_.output_channel, message);
}

}  // namespace devicehost::component
