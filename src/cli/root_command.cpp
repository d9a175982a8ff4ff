#include "devicehost/cli/root_command.hpp"

#include <iostream>
#include <memory>

#include "devicehost/commands/all_commands.hpp"
#include "devicehost/version.hpp"

namespace devicehost::cli {

RootCommand::RootCommand()
    : Command("devicehost", "Device-resident component manager") {
    options().add_options()("version,v", po::bool_switch(),
                            "Show version information");
    set_examples(
        "  devicehost serve --config config/devicehost.yaml\n"
        "  devicehost serve --singleton --address 10.0.0.5\n"
        "  devicehost components");

    add_command(std::make_shared<commands::ServeCommand>());
    add_command(std::make_shared<commands::ComponentsCommand>());
}

int RootCommand::run(const po::variables_map& vm) {
    if (vm["version"].as<bool>()) {
        print_version();
        return 0;
    }
    print_help(std::cout);
    return 0;
}

}  // namespace devicehost::cli
