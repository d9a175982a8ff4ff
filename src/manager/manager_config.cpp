#include "devicehost/manager/manager_config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace devicehost::manager {

void ManagerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    device_address = get_value(pt, "device_address", device_address);
    singleton = get_value(pt, "singleton", singleton);
    if (auto level_str = get_optional_value<std::string>(pt, "log_level")) {
        log_level = log::LogConfig::level_from_string(*level_str);
    }
    poll_interval_ms = get_value(pt, "poll_interval_ms", poll_interval_ms);
    shutdown_grace_ms = get_value(pt, "shutdown_grace_ms", shutdown_grace_ms);
    max_instances = get_value(pt, "max_instances", max_instances);
    if (auto policy_str =
            get_optional_value<std::string>(pt, "readiness_timeout_policy")) {
        readiness_timeout_policy = policy_from_string(*policy_str);
    }
    default_startup_timeout_ms = get_value(pt, "default_startup_timeout_ms",
                                           default_startup_timeout_ms);

    // Bus configuration
    bus_threads = get_value(pt, "bus_threads", bus_threads);
    serialize_delivery =
        get_value(pt, "serialize_delivery", serialize_delivery);

    if (auto components_pt = pt.get_child_optional("components")) {
        components = *components_pt;
    }
}

void ManagerConfig::validate() const {
    if (poll_interval_ms <= 0) {
        throw std::invalid_argument(
            "Manager poll_interval_ms must be greater than 0");
    }

    if (shutdown_grace_ms < 0) {
        throw std::invalid_argument(
            "Manager shutdown_grace_ms cannot be negative");
    }

    if (max_instances < 0) {
        throw std::invalid_argument(
            "Manager max_instances cannot be negative");
    }

    if (default_startup_timeout_ms <= 0) {
        throw std::invalid_argument(
            "Manager default_startup_timeout_ms must be greater than 0");
    }

    if (bus_threads <= 0) {
        throw std::invalid_argument(
            "Manager bus_threads must be greater than 0");
    }
}

boost::property_tree::ptree ManagerConfig::component_conf(
    const std::string& name) const {
    if (auto child = components.get_child_optional(
            boost::property_tree::ptree::path_type(name, '\0'))) {
        return *child;
    }
    return {};
}

ManagerConfig::ReadinessTimeoutPolicy ManagerConfig::policy_from_string(
    const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });

    if (lower == "warn") return ReadinessTimeoutPolicy::WARN;
    if (lower == "fail") return ReadinessTimeoutPolicy::FAIL;

    throw std::invalid_argument("Invalid readiness timeout policy: " + value);
}

std::string ManagerConfig::policy_to_string(ReadinessTimeoutPolicy policy) {
    switch (policy) {
        case ReadinessTimeoutPolicy::WARN:
            return "warn";
        case ReadinessTimeoutPolicy::FAIL:
            return "fail";
        default:
            return "unknown";
    }
}

}  // namespace devicehost::manager
