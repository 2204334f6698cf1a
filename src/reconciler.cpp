#include "reconciler.hpp"
#include "interfaces.hpp"
#include "upnp.hpp"

namespace upnpd {

template <typename Gateway, typename Interfaces>
reconciler<Gateway, Interfaces>::reconciler(Gateway& g, Interfaces& i) :
    gateway(g), resolver(g, i) { }

template <typename Gateway, typename Interfaces>
std::vector<operation_outcome> reconciler<Gateway, Interfaces>::apply(const std::vector<mapping_request>& requests) {
    std::vector<operation_outcome> res;
    res.reserve(requests.size());

    for(const mapping_request& r : requests) {
        spdlog::info("reconciler: add port {}", r.to_string());

        operation_outcome o = add(r);
        if(!o.ok())
            spdlog::error("reconciler: port {} ({}) failed: {}", r.port, protocol_name(r.protocol), o.message);

        res.push_back(o);
    }

    return res;
}

template <typename Gateway, typename Interfaces>
std::vector<operation_outcome> reconciler<Gateway, Interfaces>::withdraw(const std::vector<mapping_request>& requests) {
    std::vector<operation_outcome> res;
    res.reserve(requests.size());

    for(const mapping_request& r : requests) {
        spdlog::info("reconciler: remove port {}", r.to_string());
        remove(r);
        res.push_back(operation_outcome::success());
    }

    return res;
}

template <typename Gateway, typename Interfaces>
operation_outcome reconciler<Gateway, Interfaces>::add(const mapping_request& r) {
    boost::optional<resolved_target<Gateway>> t;
    try {
        t = resolver.resolve(r.address, r.port);
    } catch(gateway_error& e) {
        return operation_outcome::failure(operation_outcome::discovery, e.what());
    } catch(interface_enumeration_error& e) {
        return operation_outcome::failure(operation_outcome::interfaces, e.what());
    } catch(invalid_address_family& e) {
        return operation_outcome::failure(operation_outcome::address_family, e.what());
    }

    auto attempt = [&]() {
        gateway.add_mapping(t->gateway, r.protocol, t->port, t->bind_address, r.duration, r.comment);
    };

    try {
        attempt();
        return operation_outcome::success();
    } catch(mapping_error& e) {
        if(e.code() != mapping_error::port_in_use)
            return operation_outcome::failure(operation_outcome::mapping, e.what());
    }

    spdlog::debug("reconciler: port {} ({}) already in use, deleting mapping", r.port, protocol_name(r.protocol));
    try {
        gateway.remove_mapping(t->gateway, r.protocol, t->port);
    } catch(mapping_error& e) {
        spdlog::warn("reconciler: could not delete conflicting mapping for port {}: {}", r.port, e.what());
    }

    spdlog::debug("reconciler: retrying port mapping for port {}", r.port);
    try {
        attempt();
    } catch(mapping_error& e) {
        return operation_outcome::failure(operation_outcome::mapping, e.what());
    }

    return operation_outcome::success();
}

template <typename Gateway, typename Interfaces>
void reconciler<Gateway, Interfaces>::remove(const mapping_request& r) {
    try {
        resolved_target<Gateway> t = resolver.resolve(r.address, r.port);
        gateway.remove_mapping(t.gateway, r.protocol, t.port);
    } catch(std::runtime_error& e) {
        // the mapping may never have existed, closing ports must not fail loudly
        spdlog::warn("reconciler: the following, non-fatal error appeared while deleting port {}: {}", r.port, e.what());
    }
}

EINST(reconciler, upnp_client, interface_enumerator);
EINST(reconciler, test::mock_gateway, test::mock_interfaces);

}
