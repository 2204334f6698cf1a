#ifndef _UPNPD_INTERFACES_HPP
#define _UPNPD_INTERFACES_HPP

#include "util.hpp"
#include "error.hpp"

namespace upnpd {

struct local_interface {
    std::string name;
    address_v4 address;
};

/// @brief lists the ipv4 addresses of the local interfaces using getifaddrs.
/// loopback and non-ipv4 entries are skipped, order is whatever the os reports
class interface_enumerator {
public:
    std::vector<local_interface> list_ipv4();
};

namespace test {

// fixed list of interfaces. throws when told to, to simulate a broken os query
class mock_interfaces {
public:
    mock_interfaces() = default;
    explicit mock_interfaces(std::vector<local_interface> i) : entries(std::move(i)) { }

    std::vector<local_interface> list_ipv4() {
        calls++;
        if(fail)
            throw interface_enumeration_error("mock: interface enumeration disabled");
        return entries;
    }

    std::vector<local_interface> entries;
    bool fail = false;
    int calls = 0;
};

}

}

#endif
