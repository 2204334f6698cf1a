#include "interfaces.hpp"

#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace upnpd {

namespace {

// frees the list even if a conversion below throws
struct ifaddrs_guard {
    ifaddrs* list = nullptr;
    ~ifaddrs_guard() { if(list) freeifaddrs(list); }
};

address_v4 to_address_v4(const sockaddr* sa) {
    if(sa->sa_family != AF_INET)
        throw invalid_address_family(fmt::format("interface address family {} is not AF_INET", sa->sa_family));

    const sockaddr_in* in = reinterpret_cast<const sockaddr_in*>(sa);
    return address_v4(ntohl(in->sin_addr.s_addr));
}

}

std::vector<local_interface> interface_enumerator::list_ipv4() {
    ifaddrs_guard g;
    if(getifaddrs(&g.list) == -1) {
        throw interface_enumeration_error(
            fmt::format("getifaddrs failed: {}", std::strerror(errno)));
    }

    std::vector<local_interface> res;
    for(ifaddrs* ifa = g.list; ifa != nullptr; ifa = ifa->ifa_next) {
        if(ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
            continue;

        if(ifa->ifa_flags & IFF_LOOPBACK)
            continue;

        address_v4 addr = to_address_v4(ifa->ifa_addr);
        if(addr.is_loopback())
            continue;

        spdlog::debug("interfaces: found {} ({})", ifa->ifa_name, addr.to_string());
        res.push_back({ ifa->ifa_name, addr });
    }

    return res;
}

}
