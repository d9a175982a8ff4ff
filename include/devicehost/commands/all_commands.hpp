#pragma once
#include <csignal>

#include "devicehost/commands/components_command.hpp"
#include "devicehost/commands/serve_command.hpp"

// Set by signal_handler to the number of the last signal received
extern volatile sig_atomic_t g_signal_status;
extern void signal_handler(int signal);
