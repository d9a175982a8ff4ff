#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "devicehost/bus/message_bus.hpp"
#include "devicehost/component/component_registry.hpp"
#include "devicehost/component/runtime_instance.hpp"
#include "devicehost/component/signal.hpp"
#include "devicehost/log/logger.hpp"
#include "devicehost/manager/manager_config.hpp"
#include "devicehost/message/messages.hpp"

namespace devicehost::manager {

enum class ManagerState {
    INITIALIZING,
    READY,
    SERVING,
    SHUTTING_DOWN,
    STOPPED,
};

std::string to_string(ManagerState state);
std::ostream& operator<<(std::ostream& os, ManagerState state);

// Snapshot of one active component, for status listings.
struct ComponentStatus {
    std::string class_name;
    std::string output_channel;
    bool ready = false;
    bool running = false;
    std::chrono::milliseconds uptime{0};
};

/**
 * Device-resident manager. Listens for requests on the channel named after
 * its device address, starts components of its registry on demand and keeps
 * them running until it is told to stop.
 *
 * Lifecycle: INITIALIZING -> READY (constructed) -> SERVING (serve()) ->
 * SHUTTING_DOWN -> STOPPED. shutdown() may also be called from READY.
 */
class ComponentManager {
public:
    ComponentManager(component::ComponentRegistry registry,
                     std::shared_ptr<bus::IMessageBus> bus,
                     std::string device_address, ManagerConfig config = {});
    virtual ~ComponentManager();

    ComponentManager(const ComponentManager&) = delete;
    ComponentManager& operator=(const ComponentManager&) = delete;

    // Bind the request handler on the device address channel. Idempotent.
    // Called by serve(); call it directly to accept requests before serving.
    void listen();

    /// @brief Block until a stop request arrives or interrupted() returns
    /// true, then shut down. The predicate is polled every poll interval.
    /// @throws std::logic_error unless the manager is READY.
    void serve(const std::function<bool()>& interrupted = {});

    // Dispatch one request. Every request gets exactly one reply.
    message::Reply handle_request(const message::Message& request);

    // Start one component of a registered class on this device.
    virtual message::StartResult start_component(
        const message::StartComponentRequest& request);

    // Same effect as receiving a StopRequest.
    void request_stop();

    // Stop every component and release the request channel. Waits at most
    // the shutdown grace period for each execution unit. Idempotent.
    void shutdown();

    ManagerState state() const { return state_.load(); }
    bool stop_requested() const { return stop_signal_.is_set(); }

    const std::string& device_address() const { return device_address_; }
    const component::ComponentRegistry& registry() const { return registry_; }
    const ManagerConfig& config() const { return config_; }

    std::size_t active_count() const;
    std::vector<ComponentStatus> active_components() const;

protected:
    ComponentManager(std::string manager_type,
                     component::ComponentRegistry registry,
                     std::shared_ptr<bus::IMessageBus> bus,
                     std::string device_address, ManagerConfig config);

    log::ScopedLogger& logger() { return logger_; }

private:
    // Shared with the bus handler so a late delivery never reaches a
    // destroyed manager.
    struct RequestGate {
        std::mutex mutex;
        std::condition_variable drained;
        bool open = true;
        int in_flight = 0;
    };

    bool reserve_slot();
    void release_slot();
    void close_gate();

    component::ComponentRegistry registry_;
    std::shared_ptr<bus::IMessageBus> bus_;
    std::string device_address_;
    ManagerConfig config_;
    log::ScopedLogger logger_;

    std::atomic<ManagerState> state_{ManagerState::INITIALIZING};
    component::Signal stop_signal_;

    std::shared_ptr<RequestGate> gate_;
    std::mutex listen_mutex_;
    bool listening_ = false;

    std::mutex shutdown_mutex_;

    mutable std::mutex active_mutex_;
    std::vector<std::unique_ptr<component::ComponentRuntimeInstance>> active_;
    std::size_t pending_starts_ = 0;
    bool accepting_ = true;
};

}  // namespace devicehost::manager
