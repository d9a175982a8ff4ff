#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "devicehost/manager/component_manager.hpp"

namespace devicehost::manager {

/**
 * Manager that starts each component class at most once. Later starts of the
 * same class get a copy of the first successful reply, flagged is_singleton.
 * Starts of one class are serialized; different classes start concurrently.
 * Failed starts are not remembered, the next request tries again.
 */
class SingletonComponentManager : public ComponentManager {
public:
    SingletonComponentManager(component::ComponentRegistry registry,
                              std::shared_ptr<bus::IMessageBus> bus,
                              std::string device_address,
                              ManagerConfig config = {});
    ~SingletonComponentManager() override;

    message::StartResult start_component(
        const message::StartComponentRequest& request) override;

    bool is_cached(const std::string& component_name) const;
    std::optional<message::StartedComponentInformation> cached(
        const std::string& component_name) const;
    std::size_t cached_count() const;

private:
    // One per registered class, fixed at construction.
    std::unordered_map<std::string, std::unique_ptr<std::mutex>>
        start_mutexes_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, message::StartedComponentInformation>
        cache_;
};

// Singleton or plain manager, as the configuration asks.
std::unique_ptr<ComponentManager> make_component_manager(
    component::ComponentRegistry registry,
    std::shared_ptr<bus::IMessageBus> bus, std::string device_address,
    const ManagerConfig& config);

}  // namespace devicehost::manager
