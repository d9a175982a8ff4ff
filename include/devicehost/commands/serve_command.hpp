#pragma once
#include "devicehost/cli/command.hpp"

namespace devicehost::commands {

// Runs a component manager on this device until SIGINT/SIGTERM or a
// StopRequest.
class ServeCommand : public devicehost::cli::Command {
public:
    ServeCommand();

protected:
    int run(const devicehost::cli::po::variables_map& vm) override;
};

}  // namespace devicehost::commands
