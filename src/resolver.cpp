#include "resolver.hpp"
#include "interfaces.hpp"
#include "upnp.hpp"

namespace upnpd {

namespace {

struct candidate_filter : public boost::static_visitor<bool> {
    explicit candidate_filter(const address_v4& a) : addr(a) { }

    bool operator()(const any_address&) const { return true; }
    bool operator()(const address_v4& a) const { return a == addr; }
    bool operator()(const network_v4& n) const { return contains(n, addr); }

    address_v4 addr;
};

}

template <typename Gateway, typename Interfaces>
address_resolver<Gateway, Interfaces>::address_resolver(Gateway& g, Interfaces& i) :
    gateway(g), interfaces(i) { }

template <typename Gateway, typename Interfaces>
std::vector<address_v4> address_resolver<Gateway, Interfaces>::candidates(const address_spec& spec) {
    // a single host is assumed reachable as is, no need to ask the os
    if(const address_v4* exact = boost::get<address_v4>(&spec))
        return { *exact };

    std::vector<address_v4> res;
    for(const local_interface& i : interfaces.list_ipv4()) {
        if(boost::apply_visitor(candidate_filter(i.address), spec))
            res.push_back(i.address);
        else
            spdlog::trace("resolver: {} ({}) not in {}", i.name, i.address.to_string(), to_string(spec));
    }

    return res;
}

template <typename Gateway, typename Interfaces>
resolved_target<Gateway> address_resolver<Gateway, Interfaces>::resolve(const address_spec& spec, u16 port) {
    std::vector<address_v4> addrs = candidates(spec);

    if(boost::get<address_v4>(&spec)) {
        // let no_gateway_found through as is
        return { gateway.discover(addrs.front()), addrs.front(), port };
    }

    for(const address_v4& a : addrs) {
        try {
            auto h = gateway.discover(a);
            spdlog::debug("resolver: using {} for {}", a.to_string(), to_string(spec));
            return { h, a, port };
        } catch(gateway_error& e) {
            spdlog::debug("resolver: {}", e.what());
        }
    }

    if(addrs.empty())
        throw no_matching_gateway(fmt::format("no local interface matches {}", to_string(spec)));

    throw no_matching_gateway(fmt::format("no gateway found on any of the {} interface(s) matching {}",
        addrs.size(), to_string(spec)));
}

EINST(address_resolver, upnp_client, interface_enumerator);
EINST(address_resolver, test::mock_gateway, test::mock_interfaces);

}
