#include "mapping.hpp"

namespace upnpd {

std::string protocol_name(t_protocol p) {
    switch(p) {
    case u_TCP: return "TCP";
    case u_UDP: return "UDP";
    default: return "unknown";
    }
}

// tokens are case sensitive, same as the gateway expects them
boost::optional<t_protocol> parse_protocol(const std::string& s) {
    if(s == "TCP") return u_TCP;
    if(s == "UDP") return u_UDP;
    return boost::none;
}

bool contains(const network_v4& net, const address_v4& addr) {
    return (addr.to_uint() & net.netmask().to_uint()) == net.network().to_uint();
}

namespace {

// "192.168" -> 192.168.0.0, with prefix 16
boost::optional<std::pair<address_v4, int>> parse_short_form(const std::string& s) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while(std::getline(ss, part, '.'))
        parts.push_back(part);

    if(parts.empty() || parts.size() > 3 || s.back() == '.')
        return boost::none;

    u32 bits = 0;
    for(std::size_t i = 0; i < 4; i++) {
        u64 octet = 0;
        if(i < parts.size()) {
            boost::optional<u64> v = util::parse_uint(parts[i]);
            if(!v || *v > 255)
                return boost::none;
            octet = *v;
        }
        bits = (bits << 8) | static_cast<u32>(octet);
    }

    return std::make_pair(address_v4(bits), static_cast<int>(parts.size() * 8));
}

}

address_spec parse_address_spec(const std::string& text) {
    std::string s = util::trim(text);
    if(s.empty())
        return any_address{};

    std::string base = s, suffix;
    std::size_t slash = s.find('/');
    if(slash != std::string::npos) {
        base = s.substr(0, slash);
        suffix = s.substr(slash + 1);
        if(suffix.empty())
            throw config_error(fmt::format("missing prefix length in address '{}'", s));
    }

    boost::system::error_code ec;
    boost::asio::ip::address any = boost::asio::ip::make_address(base, ec);
    if(!ec && any.is_v6())
        throw invalid_address_family(fmt::format("'{}' is not an IPv4 address", s));

    address_v4 addr;
    int prefix = 32;

    if(!ec) {
        addr = any.to_v4();
    } else {
        auto sf = parse_short_form(base);
        if(!sf)
            throw config_error(fmt::format("invalid address '{}'", s));
        addr = sf->first;
        prefix = sf->second;
    }

    network_v4 net;
    try {
        if(suffix.empty()) {
            net = boost::asio::ip::make_network_v4(addr, static_cast<unsigned short>(prefix));
        } else if(suffix.find('.') != std::string::npos) {
            address_v4 mask = boost::asio::ip::make_address_v4(suffix, ec);
            if(ec)
                throw config_error(fmt::format("invalid netmask in address '{}'", s));
            net = boost::asio::ip::make_network_v4(addr, mask);
        } else {
            boost::optional<u64> len = util::parse_uint(suffix);
            if(!len || *len > 32)
                throw config_error(fmt::format("invalid prefix length in address '{}'", s));
            net = boost::asio::ip::make_network_v4(addr, static_cast<unsigned short>(*len));
        }
    } catch(std::logic_error& e) {
        // non-contiguous netmask
        throw config_error(fmt::format("invalid address '{}': {}", s, e.what()));
    }

    if(net.prefix_length() == 32)
        return net.address();

    return net.canonical();
}

namespace {

struct spec_printer : public boost::static_visitor<std::string> {
    std::string operator()(const any_address&) const { return "any"; }
    std::string operator()(const address_v4& a) const { return a.to_string(); }
    std::string operator()(const network_v4& n) const { return n.to_string(); }
};

}

std::string to_string(const address_spec& a) {
    return boost::apply_visitor(spec_printer(), a);
}

std::string mapping_request::to_string() const {
    return fmt::format("{{ address: {}, port: {}, protocol: {}, duration: {}, comment: \"{}\" }}",
        upnpd::to_string(address), port, protocol_name(protocol), duration, comment);
}

std::string kind_name(operation_outcome::kind_t k) {
    switch(k) {
    case operation_outcome::none: return "none";
    case operation_outcome::discovery: return "discovery";
    case operation_outcome::mapping: return "mapping";
    case operation_outcome::interfaces: return "interfaces";
    case operation_outcome::address_family: return "address family";
    default: return "unknown";
    }
}

}
