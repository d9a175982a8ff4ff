#include "devicehost/component/component_registry.hpp"

#include <stdexcept>

#include "devicehost/log/logger.hpp"

namespace devicehost::component {

ComponentRegistry::ComponentRegistry(std::vector<ComponentClass> classes) {
    for (auto& component_class : classes) {
        register_class(std::move(component_class));
    }
}

void ComponentRegistry::register_class(ComponentClass component_class) {
    const std::string name = component_class.name();
    if (contains(name)) {
        throw std::runtime_error("Component class '" + name +
                                 "' already registered");
    }

    classes_.emplace(name, std::move(component_class));
    names_.push_back(name);

    DEVICEHOST_LOG_DEBUG << "Registered component class: " << name;
}

const ComponentClass* ComponentRegistry::find(const std::string& name) const {
    auto it = classes_.find(name);
    return it != classes_.end() ? &it->second : nullptr;
}

bool ComponentRegistry::contains(const std::string& name) const {
    return classes_.find(name) != classes_.end();
}

}  // namespace devicehost::component
