#pragma once

#include <iostream>

#define DEVICEHOST_VERSION_MAJOR 0
#define DEVICEHOST_VERSION_MINOR 3
#define DEVICEHOST_VERSION_PATCH 0
#define DEVICEHOST_VERSION_STRING "0.3.0"

namespace devicehost {

inline const char* version() { return DEVICEHOST_VERSION_STRING; }

inline void print_version() {
    std::cout << "devicehost " << DEVICEHOST_VERSION_STRING << std::endl;
}

}  // namespace devicehost
