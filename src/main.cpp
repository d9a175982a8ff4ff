#include <iostream>

#include "devicehost/cli/root_command.hpp"

int main(int argc, char* argv[]) {
    try {
        devicehost::cli::RootCommand root;
        return root.execute(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
