#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "devicehost/component/component.hpp"
#include "devicehost/component/signal.hpp"

namespace devicehost::component {

enum class ReadyOutcome {
    READY,      // ready signal observed
    FAILED,     // execution unit ended with an exception before readiness
    TIMED_OUT,  // still not ready when the timeout expired
};

/**
 * One running component: owns its execution unit (a std::thread), the stop
 * and ready signals handed to the component and the launch timestamp.
 *
 * The thread keeps the component and the completion state alive on its own,
 * so an abandoned (detached) unit never touches a destroyed instance.
 */
class ComponentRuntimeInstance {
public:
    ComponentRuntimeInstance(std::string class_name, std::string output_channel,
                             std::shared_ptr<Signal> stop_signal,
                             std::shared_ptr<Signal> ready_signal,
                             std::shared_ptr<Component> component);
    ~ComponentRuntimeInstance();

    ComponentRuntimeInstance(const ComponentRuntimeInstance&) = delete;
    ComponentRuntimeInstance& operator=(const ComponentRuntimeInstance&) =
        delete;

    // Start the execution unit. Throws std::logic_error when called twice and
    // std::system_error when the thread cannot be created.
    void launch();

    ReadyOutcome wait_until_ready(std::chrono::milliseconds timeout) const;

    // Cooperative; does not wait.
    void request_stop();

    // Wait up to grace for the unit to finish. True if it finished and was
    // joined (or was never launched).
    bool join_for(std::chrono::milliseconds grace);

    // Give up on a unit that ignored its stop signal.
    void abandon();

    bool is_launched() const { return launched_; }
    bool is_ready() const { return ready_signal_->is_set(); }
    bool is_running() const;
    std::exception_ptr failure() const;

    const std::string& class_name() const { return class_name_; }
    const std::string& output_channel() const { return output_channel_; }
    const std::shared_ptr<Signal>& stop_signal() const { return stop_signal_; }
    const std::shared_ptr<Signal>& ready_signal() const {
        return ready_signal_;
    }
    std::chrono::system_clock::time_point started_at() const {
        return started_at_;
    }
    std::chrono::milliseconds uptime() const;

private:
    struct Completion {
        Signal finished;
        mutable std::mutex mutex;
        std::exception_ptr failure;
    };

    std::string class_name_;
    std::string output_channel_;
    std::shared_ptr<Signal> stop_signal_;
    std::shared_ptr<Signal> ready_signal_;
    std::shared_ptr<Component> component_;
    std::shared_ptr<Completion> completion_;
    std::thread thread_;
    bool launched_ = false;
    std::chrono::system_clock::time_point started_at_;
    std::chrono::steady_clock::time_point started_steady_;
};

}  // namespace devicehost::component
