#pragma once
#include "devicehost/cli/command.hpp"

namespace devicehost::cli {

// The devicehost executable: serve, components and --version.
class RootCommand : public Command {
public:
    RootCommand();

protected:
    int run(const po::variables_map& vm) override;
};

}  // namespace devicehost::cli
