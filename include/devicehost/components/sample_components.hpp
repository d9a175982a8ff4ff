#pragma once

#include <chrono>

#include "devicehost/component/component_registry.hpp"

namespace devicehost::components {

// Registry with the bundled components: "echo" and "heartbeat".
component::ComponentRegistry sample_registry(
    std::chrono::milliseconds startup_timeout =
        component::ComponentClass::DEFAULT_STARTUP_TIMEOUT);

}  // namespace devicehost::components
