#pragma once

#include <boost/property_tree/ptree.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "devicehost/bus/message_bus.hpp"
#include "devicehost/component/signal.hpp"
#include "devicehost/log/logger.hpp"

namespace devicehost::component {

// Everything a component is constructed with.
struct ComponentContext {
    std::string component_name;
    std::string output_channel;
    std::shared_ptr<Signal> stop_signal;
    std::shared_ptr<Signal> ready_signal;
    log::LogConfig::LogLevel log_level = log::LogConfig::LogLevel::INFO;
    boost::property_tree::ptree conf;
    // Bus to publish output on; may be null for components without output.
    std::shared_ptr<bus::IMessageBus> bus;
};

// Component base class. start() is the body of the component's execution
// unit: on_start(), then the ready signal, then run() until stop, then
// on_stop().
class Component {
public:
    explicit Component(ComponentContext context);
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    void start();

    const std::string& name() const { return context_.component_name; }
    const std::string& output_channel() const {
        return context_.output_channel;
    }
    bool is_ready() const { return context_.ready_signal->is_set(); }
    bool stop_requested() const { return context_.stop_signal->is_set(); }

protected:
    // Lifecycle hook methods
    virtual void on_start() {}
    virtual void run();
    virtual void on_stop() {}

    // True if stop was requested within the timeout.
    bool wait_for_stop(std::chrono::milliseconds timeout) const;

    // Publish on this component's output channel.
    void publish(const message::Message& message);

    const boost::property_tree::ptree& conf() const { return context_.conf; }
    const std::shared_ptr<bus::IMessageBus>& bus() const {
        return context_.bus;
    }
    log::ScopedLogger& logger() { return logger_; }

private:
    ComponentContext context_;
    log::ScopedLogger logger_;
};

}  // namespace devicehost::component
