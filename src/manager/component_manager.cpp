#include "devicehost/manager/component_manager.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace devicehost::manager {

using component::ComponentRuntimeInstance;
using component::ReadyOutcome;
using message::NotStartedMessage;
using message::StartError;

namespace {

template <typename F>
class ScopeExit {
public:
    explicit ScopeExit(F fn) : fn_(std::move(fn)) {}
    ~ScopeExit() {
        if (active_) fn_();
    }
    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

    void dismiss() { active_ = false; }

private:
    F fn_;
    bool active_ = true;
};

std::string describe(const std::exception_ptr& failure) {
    if (!failure) {
        return "component ended before signalling readiness";
    }
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

}  // namespace

std::string to_string(ManagerState state) {
    switch (state) {
        case ManagerState::INITIALIZING:
            return "INITIALIZING";
        case ManagerState::READY:
            return "READY";
        case ManagerState::SERVING:
            return "SERVING";
        case ManagerState::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        case ManagerState::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
    }
}

std::ostream& operator<<(std::ostream& os, ManagerState state) {
    return os << to_string(state);
}

ComponentManager::ComponentManager(component::ComponentRegistry registry,
                                   std::shared_ptr<bus::IMessageBus> bus,
                                   std::string device_address,
                                   ManagerConfig config)
    : ComponentManager("ComponentManager", std::move(registry), std::move(bus),
                       std::move(device_address), std::move(config)) {}

ComponentManager::ComponentManager(std::string manager_type,
                                   component::ComponentRegistry registry,
                                   std::shared_ptr<bus::IMessageBus> bus,
                                   std::string device_address,
                                   ManagerConfig config)
    : registry_(std::move(registry)),
      bus_(std::move(bus)),
      device_address_(std::move(device_address)),
      config_(std::move(config)),
      logger_(manager_type + "-" + device_address_, config_.log_level),
      gate_(std::make_shared<RequestGate>()) {
    if (!bus_) {
        throw std::invalid_argument("Component manager needs a message bus");
    }
    if (device_address_.empty()) {
        throw std::invalid_argument(
            "Component manager needs a device address");
    }
    config_.validate();

    std::ostringstream names;
    for (const auto& name : registry_.names()) {
        names << "\n - " << name;
    }
    DEVICEHOST_SLOG_INFO(logger_)
        << "Manager on device " << device_address_ << " starting";
    DEVICEHOST_SLOG_INFO(logger_)
        << "Starting component manager on ip \"" << device_address_
        << "\" with components:" << names.str();

    state_ = ManagerState::READY;
}

ComponentManager::~ComponentManager() { shutdown(); }

void ComponentManager::listen() {
    std::lock_guard<std::mutex> lock(listen_mutex_);
    if (listening_) {
        return;
    }
    auto current = state_.load();
    if (current != ManagerState::READY && current != ManagerState::SERVING) {
        throw std::logic_error("Cannot listen while manager is " +
                               to_string(current));
    }

    bus_->register_request_handler(
        device_address_,
        [this, gate = gate_](const message::Message& request) -> bus::MessagePtr {
            {
                std::lock_guard<std::mutex> gate_lock(gate->mutex);
                if (!gate->open) {
                    return std::make_shared<message::IgnoreRequestMessage>();
                }
                ++gate->in_flight;
            }
            ScopeExit leave([&gate] {
                std::lock_guard<std::mutex> gate_lock(gate->mutex);
                if (--gate->in_flight == 0) {
                    gate->drained.notify_all();
                }
            });
            return message::to_message(handle_request(request));
        });
    listening_ = true;

    DEVICEHOST_SLOG_DEBUG(logger_)
        << "Listening for requests on channel " << device_address_;
}

void ComponentManager::serve(const std::function<bool()>& interrupted) {
    auto expected = ManagerState::READY;
    if (!state_.compare_exchange_strong(expected, ManagerState::SERVING)) {
        throw std::logic_error("serve() requires a READY manager, state is " +
                               to_string(expected));
    }

    listen();
    DEVICEHOST_SLOG_INFO(logger_) << "Serving requests on " << device_address_;

    while (!stop_signal_.wait_for(config_.poll_interval())) {
        if (interrupted && interrupted()) {
            DEVICEHOST_SLOG_INFO(logger_)
                << "Interrupted, stopping component manager";
            stop_signal_.set();
        }
    }

    shutdown();
    DEVICEHOST_SLOG_INFO(logger_) << "Stopped component manager.";
}

message::Reply ComponentManager::handle_request(
    const message::Message& request) {
    if (dynamic_cast<const message::StopRequest*>(&request)) {
        DEVICEHOST_SLOG_INFO(logger_) << "Received stop request";
        request_stop();
        return message::SuccessMessage{};
    }

    const auto* start =
        dynamic_cast<const message::StartComponentRequest*>(&request);
    if (start && registry_.contains(start->component_name)) {
        DEVICEHOST_SLOG_INFO(logger_)
            << "Handling request " << start->component_name;
        return message::to_reply(start_component(*start));
    }

    DEVICEHOST_SLOG_INFO(logger_)
        << "Ignoring request "
        << (start ? start->component_name : request.type_name());
    return message::IgnoreRequestMessage{};
}

message::StartResult ComponentManager::start_component(
    const message::StartComponentRequest& request) {
    const std::string& name = request.component_name;

    const auto* component_class = registry_.find(name);
    if (!component_class) {
        return NotStartedMessage(StartError::STARTUP_FAILURE,
                                 "Unknown component class '" + name + "'");
    }
    if (stop_signal_.is_set()) {
        return NotStartedMessage(StartError::STARTUP_FAILURE,
                                 "Manager is stopping, not starting " + name);
    }

    if (!reserve_slot()) {
        DEVICEHOST_SLOG_WARN(logger_)
            << "Instance limit of " << config_.max_instances
            << " reached, rejecting " << name;
        return NotStartedMessage(
            StartError::ADMISSION_REJECTED,
            "Instance limit of " + std::to_string(config_.max_instances) +
                " reached");
    }
    ScopeExit slot([this] { release_slot(); });

    auto stop_signal = std::make_shared<component::Signal>();
    auto ready_signal = std::make_shared<component::Signal>();

    std::string output_channel;
    std::unique_ptr<ComponentRuntimeInstance> instance;
    try {
        output_channel = component_class->output_channel(device_address_);

        component::ComponentContext context;
        context.output_channel = output_channel;
        context.stop_signal = stop_signal;
        context.ready_signal = ready_signal;
        context.log_level = request.log_level;
        context.conf =
            request.conf.empty() ? config_.component_conf(name) : request.conf;
        context.bus = bus_;

        auto component = component_class->create(std::move(context));
        instance = std::make_unique<ComponentRuntimeInstance>(
            name, output_channel, stop_signal, ready_signal,
            std::move(component));
        instance->launch();
    } catch (const std::exception& e) {
        DEVICEHOST_SLOG_ERROR(logger_)
            << "Failed to start component " << name << ": " << e.what();
        return NotStartedMessage(StartError::STARTUP_FAILURE,
                                 "Failed to start " + name + ": " + e.what(),
                                 std::current_exception());
    } catch (...) {
        DEVICEHOST_SLOG_ERROR(logger_)
            << "Failed to start component " << name << ": unknown error";
        return NotStartedMessage(StartError::STARTUP_FAILURE,
                                 "Failed to start " + name + ": unknown error",
                                 std::current_exception());
    }

    const auto timeout = component_class->startup_timeout();
    switch (instance->wait_until_ready(timeout)) {
        case ReadyOutcome::READY:
            break;
        case ReadyOutcome::FAILED: {
            instance->join_for(config_.shutdown_grace());
            auto failure = instance->failure();
            return NotStartedMessage(
                StartError::STARTUP_FAILURE,
                "Component " + name + " failed to start: " + describe(failure),
                failure);
        }
        case ReadyOutcome::TIMED_OUT:
            DEVICEHOST_SLOG_ERROR(logger_)
                << "Component " << name << " refused to start within "
                << timeout.count() << " ms";
            if (config_.readiness_timeout_policy ==
                ManagerConfig::ReadinessTimeoutPolicy::FAIL) {
                instance->request_stop();
                if (!instance->join_for(config_.shutdown_grace())) {
                    DEVICEHOST_SLOG_ERROR(logger_)
                        << "Forced abandon of component " << name
                        << " after readiness timeout";
                    instance->abandon();
                }
                return NotStartedMessage(
                    StartError::STARTUP_TIMEOUT,
                    "Component " + name + " not ready within " +
                        std::to_string(timeout.count()) + " ms");
            }
            break;
    }

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        if (accepting_) {
            active_.push_back(std::move(instance));
            --pending_starts_;
            slot.dismiss();
        }
    }

    if (instance) {
        // Shutdown began while this start was in flight
        instance->request_stop();
        if (!instance->join_for(config_.shutdown_grace())) {
            instance->abandon();
        }
        return NotStartedMessage(StartError::STARTUP_FAILURE,
                                 "Manager shut down while starting " + name);
    }

    DEVICEHOST_SLOG_INFO(logger_)
        << "Started component " << name << " on channel " << output_channel;
    return message::StartedComponentInformation(output_channel);
}

void ComponentManager::request_stop() { stop_signal_.set(); }

void ComponentManager::shutdown() {
    std::lock_guard<std::mutex> shutdown_lock(shutdown_mutex_);
    auto current = state_.load();
    if (current == ManagerState::SHUTTING_DOWN ||
        current == ManagerState::STOPPED) {
        return;
    }
    state_ = ManagerState::SHUTTING_DOWN;
    stop_signal_.set();

    DEVICEHOST_SLOG_INFO(logger_) << "Trying to exit manager gracefully...";

    {
        std::lock_guard<std::mutex> lock(listen_mutex_);
        if (listening_) {
            bus_->unregister_request_handler(device_address_);
            listening_ = false;
        }
    }
    close_gate();

    std::vector<ComponentRuntimeInstance*> instances;
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        accepting_ = false;
        for (auto& instance : active_) {
            instances.push_back(instance.get());
        }
    }

    for (auto* instance : instances) {
        instance->request_stop();
    }

    // One grace period for the whole sweep, not one per instance
    const auto deadline =
        std::chrono::steady_clock::now() + config_.shutdown_grace();
    std::size_t stopped = 0;
    for (auto* instance : instances) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (instance->join_for(
                std::max(remaining, std::chrono::milliseconds(0)))) {
            ++stopped;
        } else {
            DEVICEHOST_SLOG_ERROR(logger_)
                << "Forced abandon of component " << instance->class_name()
                << ", it ignored the stop signal for "
                << config_.shutdown_grace_ms << " ms";
            instance->abandon();
        }
    }

    state_ = ManagerState::STOPPED;
    if (stopped == instances.size()) {
        DEVICEHOST_SLOG_INFO(logger_) << "Graceful exit was successful";
    } else {
        DEVICEHOST_SLOG_WARN(logger_)
            << "Stopped " << stopped << " of " << instances.size()
            << " components";
    }
}

std::size_t ComponentManager::active_count() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    return active_.size();
}

std::vector<ComponentStatus> ComponentManager::active_components() const {
    std::lock_guard<std::mutex> lock(active_mutex_);
    std::vector<ComponentStatus> statuses;
    statuses.reserve(active_.size());
    for (const auto& instance : active_) {
        ComponentStatus status;
        status.class_name = instance->class_name();
        status.output_channel = instance->output_channel();
        status.ready = instance->is_ready();
        status.running = instance->is_running();
        status.uptime = instance->uptime();
        statuses.push_back(std::move(status));
    }
    return statuses;
}

bool ComponentManager::reserve_slot() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (config_.max_instances > 0 &&
        active_.size() + pending_starts_ >=
            static_cast<std::size_t>(config_.max_instances)) {
        return false;
    }
    ++pending_starts_;
    return true;
}

void ComponentManager::release_slot() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    --pending_starts_;
}

void ComponentManager::close_gate() {
    std::unique_lock<std::mutex> lock(gate_->mutex);
    gate_->open = false;
    gate_->drained.wait(lock, [this] { return gate_->in_flight == 0; });
}

}  // namespace devicehost::manager
