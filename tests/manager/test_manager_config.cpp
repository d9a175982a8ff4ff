// tests/manager/test_manager_config.cpp
#define BOOST_TEST_MODULE ManagerConfigTests
#include <boost/test/unit_test.hpp>

#include "devicehost/config/config.hpp"
#include "devicehost/manager/manager_config.hpp"

using devicehost::config::ConfigManager;
using devicehost::manager::ManagerConfig;
using Policy = ManagerConfig::ReadinessTimeoutPolicy;

namespace {

ManagerConfig from_yaml(const std::string& yaml) {
    auto tree = ConfigManager::yaml_to_ptree(YAML::Load(yaml));
    ManagerConfig config;
    config.from_ptree(tree.get_child("manager"));
    return config;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ManagerConfigTestSuite)

BOOST_AUTO_TEST_CASE(test_defaults) {
    ManagerConfig config;
    BOOST_CHECK(config.device_address.empty());
    BOOST_CHECK(!config.singleton);
    BOOST_CHECK_EQUAL(config.poll_interval_ms, 100);
    BOOST_CHECK_EQUAL(config.max_instances, 0);
    BOOST_CHECK(config.readiness_timeout_policy == Policy::WARN);
    BOOST_CHECK_EQUAL(config.default_startup_timeout_ms, 10000);
    BOOST_CHECK_EQUAL(config.properties_name(), "manager");
    BOOST_CHECK_NO_THROW(config.validate());
}

BOOST_AUTO_TEST_CASE(test_from_yaml) {
    auto config = from_yaml(R"(
manager:
  device_address: 10.0.0.5
  singleton: true
  log_level: debug
  poll_interval_ms: 20
  shutdown_grace_ms: 500
  max_instances: 3
  readiness_timeout_policy: FAIL
  bus_threads: 4
  serialize_delivery: false
  components:
    heartbeat:
      interval_ms: 250
)");

    BOOST_CHECK_EQUAL(config.device_address, "10.0.0.5");
    BOOST_CHECK(config.singleton);
    BOOST_CHECK(config.log_level ==
                devicehost::log::LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(config.poll_interval() == std::chrono::milliseconds(20));
    BOOST_CHECK(config.shutdown_grace() == std::chrono::milliseconds(500));
    BOOST_CHECK_EQUAL(config.max_instances, 3);
    BOOST_CHECK(config.readiness_timeout_policy == Policy::FAIL);
    BOOST_CHECK_EQUAL(config.bus_threads, 4);
    BOOST_CHECK(!config.serialize_delivery);

    BOOST_CHECK_EQUAL(config.component_conf("heartbeat").get<int>("interval_ms"),
                      250);
    BOOST_CHECK(config.component_conf("echo").empty());
}

BOOST_AUTO_TEST_CASE(test_validation) {
    ManagerConfig config;
    config.poll_interval_ms = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config = ManagerConfig();
    config.max_instances = -1;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config = ManagerConfig();
    config.shutdown_grace_ms = -5;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config = ManagerConfig();
    config.bus_threads = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_policy_names) {
    BOOST_CHECK(ManagerConfig::policy_from_string("warn") == Policy::WARN);
    BOOST_CHECK(ManagerConfig::policy_from_string("Fail") == Policy::FAIL);
    BOOST_CHECK_EQUAL(ManagerConfig::policy_to_string(Policy::FAIL), "fail");
    BOOST_CHECK_THROW(ManagerConfig::policy_from_string("f\xe4il"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(ManagerConfig::policy_from_string("retry"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(from_yaml("manager:\n  readiness_timeout_policy: never\n"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_clone) {
    ManagerConfig config;
    config.device_address = "10.0.0.9";
    auto copy = config.clone();
    auto* typed = dynamic_cast<ManagerConfig*>(copy.get());
    BOOST_REQUIRE(typed != nullptr);
    BOOST_CHECK_EQUAL(typed->device_address, "10.0.0.9");
}

BOOST_AUTO_TEST_SUITE_END()
