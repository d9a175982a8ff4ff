#include "devicehost/component/component_class.hpp"

#include <stdexcept>

namespace devicehost::component {

namespace {

std::string default_output_channel(const std::string& component_name,
                                   const std::string& device_address) {
    return component_name + ":" + device_address;
}

}  // namespace

ComponentClass::ComponentClass(std::string name, Factory factory,
                               std::chrono::milliseconds startup_timeout)
    : name_(std::move(name)),
      factory_(std::move(factory)),
      startup_timeout_(startup_timeout),
      output_channel_fn_(default_output_channel) {
    if (name_.empty()) {
        throw std::invalid_argument("Component class name cannot be empty");
    }
    if (!factory_) {
        throw std::invalid_argument("Component class '" + name_ +
                                    "' needs a factory");
    }
    if (startup_timeout_.count() <= 0) {
        throw std::invalid_argument("Component class '" + name_ +
                                    "' startup timeout must be positive");
    }
}

std::string ComponentClass::output_channel(
    const std::string& device_address) const {
    return output_channel_fn_(name_, device_address);
}

ComponentClass& ComponentClass::with_output_channel(OutputChannelFn fn) {
    if (!fn) {
        throw std::invalid_argument("Output channel function cannot be empty");
    }
    output_channel_fn_ = std::move(fn);
    return *this;
}

std::shared_ptr<Component> ComponentClass::create(
    ComponentContext context) const {
    context.component_name = name_;
    auto component = factory_(std::move(context));
    if (!component) {
        throw std::runtime_error("Factory of component class '" + name_ +
                                 "' returned no instance");
    }
    return component;
}

}  // namespace devicehost::component
