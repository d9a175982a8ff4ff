#include "devicehost/commands/serve_command.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include "devicehost/bus/local_message_bus.hpp"
#include "devicehost/commands/all_commands.hpp"
#include "devicehost/components/sample_components.hpp"
#include "devicehost/config/config.hpp"
#include "devicehost/log/log_config.hpp"
#include "devicehost/log/logger.hpp"
#include "devicehost/manager/manager_config.hpp"
#include "devicehost/manager/singleton_component_manager.hpp"
#include "devicehost/net/device_address.hpp"

namespace devicehost::commands {

ServeCommand::ServeCommand()
    : devicehost::cli::Command("serve",
                               "Host components on this device until stopped") {
    options().add_options()(
        "config,c",
        cli::po::value<std::string>()->default_value(
            config::ConfigPaths::DEFAULT_CONFIG_FILE),
        "Configuration file path")(
        "singleton", cli::po::bool_switch(),
        "Start each component class at most once")(
        "address", cli::po::value<std::string>(),
        "Device address to listen on (default: autodetect)");
}

int ServeCommand::run(const cli::po::variables_map& vm) {
    auto& config_manager = config::ConfigManager::instance();
    auto log_config =
        config::ConfigurationPropertiesFactory<log::LogConfig>::create_and_register();
    auto loaded_manager_config = config::ConfigurationPropertiesFactory<
        manager::ManagerConfig>::create_and_register();

    const std::string config_file = vm["config"].as<std::string>();
    if (vm["config"].defaulted() &&
        !std::filesystem::exists(config_file)) {
        std::cout << "No configuration at " << config_file
                  << ", using defaults" << std::endl;
    } else {
        try {
            config_manager.load_config(config_file,
                                       config::format_from_path(config_file));
        } catch (const std::exception& e) {
            std::cerr << "Failed to load configuration: " << e.what()
                      << std::endl;
            return 1;
        }
    }

    auto manager_config = *loaded_manager_config;
    log::Logger::init(*log_config);

    if (vm["singleton"].as<bool>()) {
        manager_config.singleton = true;
    }
    if (vm.count("address")) {
        manager_config.device_address = vm["address"].as<std::string>();
    }

    std::string device_address = manager_config.device_address.empty()
                                     ? net::resolve_device_address()
                                     : manager_config.device_address;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    auto bus = std::make_shared<bus::LocalMessageBus>(
        manager_config.bus_threads, manager_config.serialize_delivery);
    try {
        auto manager = manager::make_component_manager(
            components::sample_registry(
                manager_config.default_startup_timeout()),
            bus, device_address, manager_config);

        DEVICEHOST_LOG_INFO << "Component manager running on "
                            << device_address << ". Press Ctrl+C to exit.";
        manager->serve([] { return g_signal_status != 0; });
    } catch (const std::exception& e) {
        DEVICEHOST_LOG_ERROR << "Component manager failed: " << e.what();
        exit_code = 1;
    }

    bus->close();
    DEVICEHOST_LOG_INFO << "devicehost finished.";
    log::Logger::shutdown();
    return exit_code;
}

}  // namespace devicehost::commands
