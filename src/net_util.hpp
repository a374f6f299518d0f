#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ports {

// IPv4 addresses of interfaces that are up and not loopback, in interface order.
// Throws std::system_error if the interface list cannot be read.
std::vector<std::string> local_network_addresses();

// http://127.0.0.1:port/ first, then one URL per local network address for a LAN server
std::vector<std::string> server_urls(uint16_t port, bool expose_to_lan);

} // namespace ports
