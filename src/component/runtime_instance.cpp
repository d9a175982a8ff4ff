#include "devicehost/component/runtime_instance.hpp"

#include <algorithm>
#include <stdexcept>

#include "devicehost/log/logger.hpp"

namespace devicehost::component {

namespace {
// Granularity of the readiness wait while also watching for early failure
constexpr std::chrono::milliseconds READY_POLL_SLICE{5};
}  // namespace

ComponentRuntimeInstance::ComponentRuntimeInstance(
    std::string class_name, std::string output_channel,
    std::shared_ptr<Signal> stop_signal, std::shared_ptr<Signal> ready_signal,
    std::shared_ptr<Component> component)
    : class_name_(std::move(class_name)),
      output_channel_(std::move(output_channel)),
      stop_signal_(std::move(stop_signal)),
      ready_signal_(std::move(ready_signal)),
      component_(std::move(component)),
      completion_(std::make_shared<Completion>()) {
    if (!stop_signal_ || !ready_signal_ || !component_) {
        throw std::invalid_argument("Runtime instance of '" + class_name_ +
                                    "' needs signals and a component");
    }
}

ComponentRuntimeInstance::~ComponentRuntimeInstance() {
    if (thread_.joinable()) {
        stop_signal_->set();
        if (completion_->finished.wait_for(std::chrono::milliseconds(0))) {
            thread_.join();
        } else {
            DEVICEHOST_LOG_WARN << "Destroying runtime instance of "
                                << class_name_
                                << " while its thread still runs, detaching";
            thread_.detach();
        }
    }
}

void ComponentRuntimeInstance::launch() {
    if (launched_) {
        throw std::logic_error("Component '" + class_name_ +
                               "' already launched");
    }

    started_at_ = std::chrono::system_clock::now();
    started_steady_ = std::chrono::steady_clock::now();

    thread_ = std::thread([component = component_, completion = completion_,
                           name = class_name_]() {
        try {
            component->start();
        } catch (const std::exception& e) {
            DEVICEHOST_LOG_ERROR << "Component " << name
                                 << " terminated with error: " << e.what();
            std::lock_guard<std::mutex> lock(completion->mutex);
            completion->failure = std::current_exception();
        }
        completion->finished.set();
    });
    launched_ = true;
}

ReadyOutcome ComponentRuntimeInstance::wait_until_ready(
    std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (ready_signal_->is_set()) {
            return ReadyOutcome::READY;
        }
        if (completion_->finished.is_set()) {
            return ready_signal_->is_set() ? ReadyOutcome::READY
                                           : ReadyOutcome::FAILED;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return ReadyOutcome::TIMED_OUT;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - now);
        ready_signal_->wait_for(std::min(
            std::max(remaining, std::chrono::milliseconds(1)), READY_POLL_SLICE));
    }
}

void ComponentRuntimeInstance::request_stop() { stop_signal_->set(); }

bool ComponentRuntimeInstance::join_for(std::chrono::milliseconds grace) {
    if (!thread_.joinable()) {
        return true;
    }
    if (!completion_->finished.wait_for(grace)) {
        return false;
    }
    thread_.join();
    return true;
}

void ComponentRuntimeInstance::abandon() {
    if (thread_.joinable()) {
        thread_.detach();
    }
}

bool ComponentRuntimeInstance::is_running() const {
    return launched_ && !completion_->finished.is_set();
}

std::exception_ptr ComponentRuntimeInstance::failure() const {
    std::lock_guard<std::mutex> lock(completion_->mutex);
    return completion_->failure;
}

std::chrono::milliseconds ComponentRuntimeInstance::uptime() const {
    if (!launched_) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_steady_);
}

}  // namespace devicehost::component
