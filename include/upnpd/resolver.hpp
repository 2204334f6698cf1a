#ifndef _UPNPD_RESOLVER_HPP
#define _UPNPD_RESOLVER_HPP

#include "util.hpp"
#include "mapping.hpp"

namespace upnpd {

/// @brief a gateway that answered, the local address it answered on and the
/// port to map. lives only as long as the add/remove that needs it
template <typename Gateway>
struct resolved_target {
    typename Gateway::handle gateway;
    address_v4 bind_address;
    u16 port;
};

/// @brief turns an address specifier into a gateway to talk to.
///
/// exact addresses are used as they are, without looking at the local
/// interfaces. ranges and missing addresses are matched against the
/// interfaces at runtime, since the local address may change between boots.
/// first candidate whose discovery succeeds wins. with several matching
/// interfaces the choice follows the enumeration order of the os and is
/// therefore not stable across systems.
template <typename Gateway, typename Interfaces>
class address_resolver {
public:
    address_resolver(Gateway&, Interfaces&);

    /// @brief bind addresses to try, in order
    /// @throws interface_enumeration_error unless given an exact address
    std::vector<address_v4> candidates(const address_spec&);

    /// @throws no_gateway_found (exact) or no_matching_gateway (range/any)
    resolved_target<Gateway> resolve(const address_spec&, u16);

private:
    Gateway& gateway;
    Interfaces& interfaces;
};

}

#endif
