#include "devicehost/manager/singleton_component_manager.hpp"

#include <utility>

namespace devicehost::manager {

SingletonComponentManager::SingletonComponentManager(
    component::ComponentRegistry registry,
    std::shared_ptr<bus::IMessageBus> bus, std::string device_address,
    ManagerConfig config)
    : ComponentManager("SingletonComponentManager", std::move(registry),
                       std::move(bus), std::move(device_address),
                       std::move(config)) {
    for (const auto& name : this->registry().names()) {
        start_mutexes_.emplace(name, std::make_unique<std::mutex>());
    }
}

// Stop request handling before the overriding members go away
SingletonComponentManager::~SingletonComponentManager() { shutdown(); }

message::StartResult SingletonComponentManager::start_component(
    const message::StartComponentRequest& request) {
    const std::string& name = request.component_name;

    auto mutex_it = start_mutexes_.find(name);
    if (mutex_it == start_mutexes_.end()) {
        return ComponentManager::start_component(request);
    }
    std::lock_guard<std::mutex> start_lock(*mutex_it->second);

    // A cached instance has already been told to stop
    if (stop_requested()) {
        return message::NotStartedMessage(
            message::StartError::STARTUP_FAILURE,
            "Manager is stopping, not starting " + name);
    }

    if (auto existing = cached(name)) {
        DEVICEHOST_SLOG_INFO(logger())
            << "Reusing existing component " << name << " on "
            << existing->output_channel;
        return *existing;
    }

    DEVICEHOST_SLOG_INFO(logger()) << "Starting new component " << name;
    auto result = ComponentManager::start_component(request);

    if (auto* started =
            std::get_if<message::StartedComponentInformation>(&result)) {
        started->is_singleton = true;
        std::lock_guard<std::mutex> lock(cache_mutex_);
        cache_.emplace(name, *started);
    }
    return result;
}

bool SingletonComponentManager::is_cached(
    const std::string& component_name) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.count(component_name) > 0;
}

std::optional<message::StartedComponentInformation>
SingletonComponentManager::cached(const std::string& component_name) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(component_name);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SingletonComponentManager::cached_count() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

std::unique_ptr<ComponentManager> make_component_manager(
    component::ComponentRegistry registry,
    std::shared_ptr<bus::IMessageBus> bus, std::string device_address,
    const ManagerConfig& config) {
    if (config.singleton) {
        return std::make_unique<SingletonComponentManager>(
            std::move(registry), std::move(bus), std::move(device_address),
            config);
    }
    return std::make_unique<ComponentManager>(
        std::move(registry), std::move(bus), std::move(device_address),
        config);
}

}  // namespace devicehost::manager
