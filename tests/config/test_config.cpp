// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>  // for file operations
#include <boost/test/unit_test.hpp>
#include <fstream>

#include "devicehost/config/config.hpp"
#include "devicehost/log/log_config.hpp"
#include "devicehost/manager/manager_config.hpp"

namespace fs = boost::filesystem;

using devicehost::config::ConfigFormat;
using devicehost::config::ConfigManager;
using devicehost::log::LogConfig;
using devicehost::manager::ManagerConfig;

// Test fixture: create and cleanup temporary config files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / "devicehost_test_configs";

    ConfigFixture() { fs::create_directories(temp_dir); }

    ~ConfigFixture() {
        fs::remove_all(temp_dir);  // cleanup temporary directory
    }

    // Helper function: create temporary config file
    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_config) {
    const std::string yaml_content = R"(
manager:
  device_address: 10.0.0.5
  components:
    heartbeat:
      interval_ms: 250
)";

    fs::path config_path = create_temp_file("nested.yaml", yaml_content);

    auto& config_manager = ConfigManager::instance();
    config_manager.reset();

    BOOST_CHECK_NO_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML));

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("manager.device_address"),
                      "10.0.0.5");
    BOOST_CHECK_EQUAL(
        config_tree.get<int>("manager.components.heartbeat.interval_ms"), 250);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    auto& config_manager = ConfigManager::instance();
    config_manager.reset();

    BOOST_CHECK_THROW(config_manager.load_config("non_existent_file.yaml",
                                                 ConfigFormat::YAML),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_manager_singleton) {
    auto& config1 = ConfigManager::instance();
    auto& config2 = ConfigManager::instance();

    BOOST_CHECK_EQUAL(&config1, &config2);
}

BOOST_AUTO_TEST_CASE(test_config_formats) {
    auto& config_manager = ConfigManager::instance();
    config_manager.reset();

    fs::path json_path = create_temp_file(
        "test.json", R"({"manager": {"device_address": "10.0.0.7"}})");
    BOOST_CHECK(devicehost::config::format_from_path(json_path.string()) ==
                ConfigFormat::JSON);
    BOOST_CHECK_NO_THROW(
        config_manager.load_config(json_path.string(), ConfigFormat::JSON));
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>(
            "manager.device_address"),
        "10.0.0.7");

    fs::path ini_path =
        create_temp_file("test.ini", "[manager]\nsingleton=true\n");
    BOOST_CHECK(devicehost::config::format_from_path(ini_path.string()) ==
                ConfigFormat::INI);
    BOOST_CHECK_NO_THROW(
        config_manager.load_config(ini_path.string(), ConfigFormat::INI));
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<bool>("manager.singleton"), true);

    BOOST_CHECK(devicehost::config::format_from_path("a/b.yml") ==
                ConfigFormat::YAML);
}

BOOST_AUTO_TEST_CASE(test_registered_properties_populated) {
    auto& config_manager = ConfigManager::instance();
    config_manager.reset();

    auto manager_config = std::make_shared<ManagerConfig>();
    auto log_config = std::make_shared<LogConfig>();
    config_manager.register_configuration_properties<ManagerConfig>(
        manager_config);
    config_manager.register_configuration_properties<LogConfig>(log_config);

    config_manager.load_yaml_string(R"(
log:
  global_level: debug
manager:
  singleton: true
  max_instances: 4
  readiness_timeout_policy: fail
)");

    auto loaded = config_manager.get_configuration_properties<ManagerConfig>();
    BOOST_REQUIRE(loaded);
    BOOST_CHECK(loaded->singleton);
    BOOST_CHECK_EQUAL(loaded->max_instances, 4);
    BOOST_CHECK(loaded->readiness_timeout_policy ==
                ManagerConfig::ReadinessTimeoutPolicy::FAIL);
    BOOST_CHECK(config_manager.get_configuration_properties<LogConfig>()
                    ->global_level == LogConfig::LogLevel::DEBUG);

    auto by_name = config_manager.get_config_by_name("manager");
    BOOST_CHECK(by_name.get() == manager_config.get());
}

BOOST_AUTO_TEST_CASE(test_invalid_properties_rejected) {
    auto& config_manager = ConfigManager::instance();
    config_manager.reset();
    config_manager.register_configuration_properties<ManagerConfig>(
        std::make_shared<ManagerConfig>());

    fs::path config_path = create_temp_file("bad.yaml", R"(
manager:
  poll_interval_ms: 0
)");
    BOOST_CHECK_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    fs::path config_path = create_temp_file("reset_test.yaml", R"(
temp:
  data: should_be_reset
)");
    auto& config_manager = ConfigManager::instance();
    config_manager.reset();

    config_manager.load_config(config_path.string(), ConfigFormat::YAML);

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("temp.data"),
                      "should_be_reset");

    // Reset and verify config is empty
    config_manager.reset();
    const auto& empty_tree = config_manager.get_config_tree();
    BOOST_CHECK_THROW(empty_tree.get<std::string>("temp.data"),
                      boost::property_tree::ptree_bad_path);
}

BOOST_AUTO_TEST_SUITE_END()
