#ifndef _UPNPD_MAPPING_HPP
#define _UPNPD_MAPPING_HPP

#include "util.hpp"
#include "error.hpp"

namespace upnpd {

enum t_protocol {
    u_TCP,
    u_UDP
};

std::string protocol_name(t_protocol);
boost::optional<t_protocol> parse_protocol(const std::string&);

// no address given, try every interface
struct any_address {
    bool operator==(const any_address&) const { return true; }
};

/// @brief where a mapping should point: anywhere, one host, or a range of
/// hosts that the local interfaces are matched against
typedef boost::variant<any_address, address_v4, network_v4> address_spec;

/// @brief parse an address specifier as written in config files.
/// accepts "", "a.b.c.d", "a.b.c.d/n", "a.b.c.d/m.m.m.m" and the shortened
/// forms "a", "a.b", "a.b.c". a /32 range is a single host.
/// @throws invalid_address_family for ipv6 input, config_error otherwise
address_spec parse_address_spec(const std::string&);
std::string to_string(const address_spec&);

bool contains(const network_v4&, const address_v4&);

/// @brief the unit of desired state. one row of the config file
struct mapping_request {
    address_spec address;
    u16 port;
    t_protocol protocol;
    u32 duration;
    std::string comment;

    mapping_request() : address(any_address{}), port(0), protocol(u_TCP), duration(0) { }
    mapping_request(address_spec a, u16 p, t_protocol pr, u32 d, std::string c) :
        address(a), port(p), protocol(pr), duration(d), comment(std::move(c)) { }

    std::string to_string() const;
};

/// @brief what happened to one request of a batch
struct operation_outcome {
    enum kind_t {
        none,
        discovery,
        mapping,
        interfaces,
        address_family
    };

    kind_t kind;
    std::string message;

    bool ok() const { return kind == none; }

    static operation_outcome success() { return { none, "" }; }
    static operation_outcome failure(kind_t k, const std::string& m) { return { k, m }; }
};

std::string kind_name(operation_outcome::kind_t);

}

#endif
