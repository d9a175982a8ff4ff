#include "devicehost/components/sample_components.hpp"

#include "devicehost/components/echo_component.hpp"
#include "devicehost/components/heartbeat_component.hpp"

namespace devicehost::components {

component::ComponentRegistry sample_registry(
    std::chrono::milliseconds startup_timeout) {
    component::ComponentRegistry registry;
    registry.register_class(
        component::ComponentClass::of<EchoComponent>("echo", startup_timeout));
    registry.register_class(component::ComponentClass::of<HeartbeatComponent>(
        "heartbeat", startup_timeout));
    return registry;
}

}  // namespace devicehost::components
