#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "devicehost/component/component.hpp"

namespace devicehost::component {

/// @brief A named kind of component the manager can start.
/// Holds the factory producing instances, the startup timeout and the rule
/// that turns a device address into the output channel.
class ComponentClass {
public:
    using Factory =
        std::function<std::shared_ptr<Component>(ComponentContext context)>;
    using OutputChannelFn =
        std::function<std::string(const std::string& component_name,
                                  const std::string& device_address)>;

    // Number of milliseconds we wait at most for a component to start
    static constexpr std::chrono::milliseconds DEFAULT_STARTUP_TIMEOUT{10000};

    ComponentClass(std::string name, Factory factory,
                   std::chrono::milliseconds startup_timeout =
                       DEFAULT_STARTUP_TIMEOUT);

    template <typename T>
    static ComponentClass of(std::string name,
                             std::chrono::milliseconds startup_timeout =
                                 DEFAULT_STARTUP_TIMEOUT) {
        return ComponentClass(
            std::move(name),
            [](ComponentContext context) -> std::shared_ptr<Component> {
                return std::make_shared<T>(std::move(context));
            },
            startup_timeout);
    }

    const std::string& name() const { return name_; }
    std::chrono::milliseconds startup_timeout() const {
        return startup_timeout_;
    }

    // Pure function of (name, device address), "<name>:<address>" by default.
    std::string output_channel(const std::string& device_address) const;

    ComponentClass& with_output_channel(OutputChannelFn fn);

    /// @brief Construct an instance; the context's component_name is filled
    /// in here.
    /// @throws whatever the factory throws, std::runtime_error if it returns
    /// nothing.
    std::shared_ptr<Component> create(ComponentContext context) const;

private:
    std::string name_;
    Factory factory_;
    std::chrono::milliseconds startup_timeout_;
    OutputChannelFn output_channel_fn_;
};

}  // namespace devicehost::component
