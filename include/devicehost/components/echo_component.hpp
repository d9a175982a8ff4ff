#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "devicehost/bus/message_bus.hpp"
#include "devicehost/component/component.hpp"

namespace devicehost::components {

// Republishes every message received on "<output channel>:input" to its
// output channel.
class EchoComponent : public component::Component {
public:
    explicit EchoComponent(component::ComponentContext context);

    static std::string input_channel(const std::string& output_channel) {
        return output_channel + ":input";
    }

    std::size_t echoed() const { return state_->echoed.load(); }

protected:
    void on_start() override;
    void on_stop() override;

private:
    // Shared with the subscription, which may outlive this component
    struct EchoState {
        std::atomic<bool> active{true};
        std::atomic<std::size_t> echoed{0};
    };

    std::shared_ptr<EchoState> state_;
    std::optional<bus::SubscriptionId> subscription_;
};

}  // namespace devicehost::components
