#include "devicehost/commands/components_command.hpp"

#include <iomanip>
#include <iostream>

#include "devicehost/components/sample_components.hpp"
#include "devicehost/net/device_address.hpp"

namespace devicehost::commands {

ComponentsCommand::ComponentsCommand()
    : devicehost::cli::Command("components",
                               "List the component classes this host serves") {
    options().add_options()(
        "address", cli::po::value<std::string>(),
        "Device address used for output channel names (default: autodetect)");
}

int ComponentsCommand::run(const cli::po::variables_map& vm) {
    const std::string address = vm.count("address")
                                    ? vm["address"].as<std::string>()
                                    : net::resolve_device_address();

    auto registry = components::sample_registry();
    std::cout << "Components on " << address << ":" << std::endl;
    for (const auto& name : registry.names()) {
        const auto* component_class = registry.find(name);
        std::cout << "  " << std::left << std::setw(12) << name
                  << component_class->output_channel(address) << "  (timeout "
                  << component_class->startup_timeout().count() << " ms)"
                  << std::endl;
    }
    return 0;
}

}  // namespace devicehost::commands
