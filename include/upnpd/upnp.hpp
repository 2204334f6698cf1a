#ifndef _UPNPD_UPNP_HPP
#define _UPNPD_UPNP_HPP

#include <map>
#include <set>

#include "util.hpp"
#include "error.hpp"
#include "mapping.hpp"

namespace upnpd {

/// @brief sort a failed upnp command result into a mapping_error code.
/// 718 on add is a conflict, 714 on delete means there was nothing to delete
mapping_error::code_t classify_upnp_error(int result, bool removing);

/// @brief what discovery leaves behind: enough to talk to one igd.
/// never cached, every pass discovers again
struct igd_handle {
    std::string control_url;
    std::string service_type;
    std::string lan_address; // our address as seen by the igd
    address_v4 bind_address;
};

/// @brief a wrapper for miniupnp. discovers an igd through one local
/// interface and adds/removes port mappings on it.
///
/// any type used in place of this one (see test::mock_gateway) must provide
/// the same `handle` typedef and the three operations below.
class upnp_client {
public:
    typedef igd_handle handle;

    explicit upnp_client(int timeout_ms = constants::discover_timeout_ms);

    /// @throws no_gateway_found
    handle discover(const address_v4&);

    /// @brief internal and external port are the same
    /// @throws mapping_error, port_in_use if the slot is taken
    void add_mapping(const handle&, t_protocol, u16, const address_v4&, u32, const std::string&);

    /// @throws mapping_error, not_found if there was nothing to delete
    void remove_mapping(const handle&, t_protocol, u16);

    int timeout() const { return timeout_ms; }

private:
    int timeout_ms;
};

namespace test {

// in-memory gateway. mapping slots are keyed by (protocol, port) like on a
// real igd, every call is recorded in `calls`
class mock_gateway {
public:
    struct handle {
        address_v4 bind_address;
    };

    struct entry {
        address_v4 target;
        u32 duration;
        std::string comment;
    };

    typedef std::pair<t_protocol, u16> slot;

    handle discover(const address_v4& bind) {
        discovered.push_back(bind);
        calls.push_back("discover " + bind.to_string());
        if(unreachable.count(bind.to_string()))
            throw no_gateway_found(fmt::format("mock: no gateway behind {}", bind.to_string()));
        return handle{ bind };
    }

    void add_mapping(const handle&, t_protocol p, u16 port, const address_v4& target, u32 duration, const std::string& comment) {
        calls.push_back(fmt::format("add {} {}", protocol_name(p), port));
        if(rejected.count(port))
            throw mapping_error(mapping_error::other, 501, "mock: action failed");
        if(always_conflict || mappings.count({ p, port }))
            throw mapping_error(mapping_error::port_in_use, 718, "mock: conflict in mapping entry");
        mappings[{ p, port }] = entry{ target, duration, comment };
    }

    void remove_mapping(const handle&, t_protocol p, u16 port) {
        calls.push_back(fmt::format("remove {} {}", protocol_name(p), port));
        if(fail_remove)
            throw mapping_error(mapping_error::other, 501, "mock: action failed");
        if(mappings.erase({ p, port }) == 0)
            throw mapping_error(mapping_error::not_found, 714, "mock: no such entry in array");
    }

    std::map<slot, entry> mappings;
    std::set<std::string> unreachable;
    std::set<u16> rejected;
    bool always_conflict = false;
    bool fail_remove = false;

    std::vector<address_v4> discovered;
    std::vector<std::string> calls;
};

}

}

#endif
