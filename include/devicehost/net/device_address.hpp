#pragma once

#include <string>

namespace devicehost::net {

// Address used when no outbound interface can be determined.
inline constexpr const char* LOOPBACK_ADDRESS = "127.0.0.1";

/// @brief Determine the IPv4 address this device is reachable at.
/// Connects an unbound UDP socket towards a non-routable probe address (no
/// datagram is sent) and reads back the local endpoint the kernel picked.
/// Falls back to LOOPBACK_ADDRESS when the device has no route.
std::string resolve_device_address();

}  // namespace devicehost::net
