#include "net_util.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <array>
#include <cerrno>
#include <system_error>

namespace ports {

std::vector<std::string> local_network_addresses() {
    struct ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) != 0) {
        throw std::system_error(errno, std::system_category(), "getifaddrs() failed");
    }

    std::vector<std::string> out;
    std::array<char, INET_ADDRSTRLEN> ip{};
    for (struct ifaddrs* cursor = ifaddr; cursor != nullptr; cursor = cursor->ifa_next) {
        if (cursor->ifa_addr == nullptr || cursor->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(cursor->ifa_flags & IFF_UP) || (cursor->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }

        auto* sin = reinterpret_cast<struct sockaddr_in*>(cursor->ifa_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, ip.data(), ip.size()) == nullptr) {
            auto ec = errno;
            ::freeifaddrs(ifaddr);
            throw std::system_error(ec, std::system_category(), "inet_ntop() failed");
        }
        out.emplace_back(ip.data());
    }

    ::freeifaddrs(ifaddr);
    return out;
}

std::vector<std::string> server_urls(uint16_t port, bool expose_to_lan) {
    std::vector<std::string> urls;
    urls.push_back("http://127.0.0.1:" + std::to_string(port) + "/");
    if (!expose_to_lan) {
        return urls;
    }

    try {
        for (const auto& addr : local_network_addresses()) {
            urls.push_back("http://" + addr + ":" + std::to_string(port) + "/");
        }
    } catch (const std::system_error& e) {
        spdlog::warn("Cannot list network interfaces: {}", e.what());
    }
    return urls;
}

} // namespace ports
