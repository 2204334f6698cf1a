#include "upnp.hpp"

#include "miniupnpc/miniupnpc.h"
#include "miniupnpc/upnpcommands.h"
#include "miniupnpc/upnperrors.h"

namespace upnpd {

namespace {

// miniupnpc 2.2.8 (api 18) added the wan address out-parameter
#if MINIUPNPC_API_VERSION >= 18
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr), nullptr, 0
#else
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr)
#endif

const int upnp_conflict_in_mapping_entry = 718;
const int upnp_no_such_entry_in_array = 714;

struct devlist_deleter {
    void operator()(UPNPDev* d) const { freeUPNPDevlist(d); }
};

std::string describe(int r) {
    const char* s = strupnperror(r);
    return s ? fmt::format("{} ({})", s, r) : fmt::format("error {}", r);
}

}

mapping_error::code_t classify_upnp_error(int r, bool removing) {
    if(!removing && r == upnp_conflict_in_mapping_entry)
        return mapping_error::port_in_use;
    if(removing && r == upnp_no_such_entry_in_array)
        return mapping_error::not_found;
    return mapping_error::other;
}

upnp_client::upnp_client(int t) : timeout_ms(t) { }

// looking at miniupnpc/src/upnpc.c
upnp_client::handle upnp_client::discover(const address_v4& bind) {
    int error = 0;
    std::string bind_s = bind.to_string();

    spdlog::debug("upnp: searching gateway via {} (timeout {} ms)", bind_s, timeout_ms);

    std::unique_ptr<UPNPDev, devlist_deleter> devlist(upnpDiscover(
        timeout_ms, bind_s.c_str(), nullptr,
        UPNP_LOCAL_PORT_ANY, 0, constants::discover_ttl, &error));

    if(!devlist) {
        throw no_gateway_found(fmt::format("no UPnP device answered on {} (error {})", bind_s, error));
    }

    UPNPUrls urls{};
    IGDdatas data{};
    char lan_addr[64] = { 0 };

    int r = UPNP_GetValidIGD(UPNP_GETVALIDIGD_ARGS(devlist.get(), &urls, &data, lan_addr));

    handle h;
    h.bind_address = bind;
    if(r == 1 || r == 2) {
        h.control_url = urls.controlURL ? urls.controlURL : "";
        h.service_type = data.first.servicetype;
        h.lan_address = lan_addr;
    }

    FreeUPNPUrls(&urls);

    if(h.control_url.empty()) {
        throw no_gateway_found(fmt::format("no valid IGD found via {} (result {})", bind_s, r));
    }

    spdlog::debug("upnp: gateway {} found via {} (lan address {})", h.control_url, bind_s, h.lan_address);

    return h;
}

void upnp_client::add_mapping(const handle& h, t_protocol proto, u16 port,
    const address_v4& target, u32 duration, const std::string& comment) {
    std::string port_s = std::to_string(port),
        lease = std::to_string(duration),
        target_s = target.to_string(),
        proto_s = protocol_name(proto);

    int r = UPNP_AddPortMapping(h.control_url.c_str(), h.service_type.c_str(),
        port_s.c_str(), port_s.c_str(),
        target_s.c_str(), comment.c_str(), proto_s.c_str(),
        nullptr, lease.c_str());

    if(r != UPNPCOMMAND_SUCCESS) {
        throw mapping_error(classify_upnp_error(r, false), r, fmt::format("AddPortMapping {} {} -> {} failed: {}",
            proto_s, port, target_s, describe(r)));
    }

    spdlog::debug("upnp: added port mapping {} {} -> {}:{} for {}s", proto_s, port, target_s, port, duration);
}

void upnp_client::remove_mapping(const handle& h, t_protocol proto, u16 port) {
    std::string port_s = std::to_string(port),
        proto_s = protocol_name(proto);

    int r = UPNP_DeletePortMapping(h.control_url.c_str(), h.service_type.c_str(),
        port_s.c_str(), proto_s.c_str(), nullptr);

    if(r != UPNPCOMMAND_SUCCESS) {
        throw mapping_error(classify_upnp_error(r, true), r, fmt::format("DeletePortMapping {} {} failed: {}",
            proto_s, port, describe(r)));
    }

    spdlog::debug("upnp: deleted port mapping {} {}", proto_s, port);
}

}
