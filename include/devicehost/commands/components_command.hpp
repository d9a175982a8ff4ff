#pragma once
#include "devicehost/cli/command.hpp"

namespace devicehost::commands {

// Lists the component classes this build can host.
class ComponentsCommand : public devicehost::cli::Command {
public:
    ComponentsCommand();

protected:
    int run(const devicehost::cli::po::variables_map& vm) override;
};

}  // namespace devicehost::commands
