#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "devicehost/component/component_class.hpp"

namespace devicehost::component {

// Name -> component class. Names are unique; lookups return nullptr when a
// name is not registered.
class ComponentRegistry {
public:
    ComponentRegistry() = default;
    explicit ComponentRegistry(std::vector<ComponentClass> classes);

    // Throws std::runtime_error if the name is already registered.
    void register_class(ComponentClass component_class);

    const ComponentClass* find(const std::string& name) const;
    bool contains(const std::string& name) const;

    // Registered names in registration order.
    const std::vector<std::string>& names() const { return names_; }
    std::size_t size() const { return classes_.size(); }
    bool empty() const { return classes_.empty(); }

private:
    std::unordered_map<std::string, ComponentClass> classes_;
    std::vector<std::string> names_;
};

}  // namespace devicehost::component
