#pragma once

#include <chrono>
#include <string>

#include "devicehost/config/config.hpp"
#include "devicehost/log/log_config.hpp"

namespace devicehost::manager {

// Component manager configuration
class ManagerConfig
    : public config::ClonableConfigurationProperties<ManagerConfig> {
public:
    // What a start does when the component is not ready in time
    enum class ReadinessTimeoutPolicy {
        WARN,  // log an error, keep the instance, reply success
        FAIL,  // stop the instance, reply NotStartedMessage
    };

    // Configuration data
    std::string device_address;  // empty means resolve at startup
    bool singleton = false;
    log::LogConfig::LogLevel log_level = log::LogConfig::LogLevel::INFO;
    int poll_interval_ms = 100;
    int shutdown_grace_ms = 2000;
    int max_instances = 0;  // 0 means unbounded
    ReadinessTimeoutPolicy readiness_timeout_policy =
        ReadinessTimeoutPolicy::WARN;
    int default_startup_timeout_ms = 10000;

    // Bus settings
    int bus_threads = 2;
    bool serialize_delivery = true;

    // Per component configuration, keyed by component class name
    boost::property_tree::ptree components;

    // ConfigurationProperties interface implementation
    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "manager"; }

    std::chrono::milliseconds poll_interval() const {
        return std::chrono::milliseconds(poll_interval_ms);
    }
    std::chrono::milliseconds shutdown_grace() const {
        return std::chrono::milliseconds(shutdown_grace_ms);
    }
    std::chrono::milliseconds default_startup_timeout() const {
        return std::chrono::milliseconds(default_startup_timeout_ms);
    }

    // Configuration subtree for one component class, empty when absent
    boost::property_tree::ptree component_conf(const std::string& name) const;

    static ReadinessTimeoutPolicy policy_from_string(const std::string& value);
    static std::string policy_to_string(ReadinessTimeoutPolicy policy);
};

}  // namespace devicehost::manager
