#include "catch2/catch_all.hpp"

#include <boost/optional/optional_io.hpp>

#include "mapping.hpp"

using namespace upnpd;

static address_v4 ip(const char* s) {
    return boost::asio::ip::make_address_v4(s);
}

TEST_CASE("empty address means any interface", "[address]") {
    address_spec empty = parse_address_spec("");
    REQUIRE(boost::get<any_address>(&empty) != nullptr);
    address_spec blank = parse_address_spec("   ");
    REQUIRE(boost::get<any_address>(&blank) != nullptr);
}

TEST_CASE("single hosts", "[address]") {
    address_spec a = parse_address_spec("192.168.0.10");
    REQUIRE(boost::get<address_v4>(&a) != nullptr);
    REQUIRE(boost::get<address_v4>(a) == ip("192.168.0.10"));

    // a /32 is still one host, not a range
    address_spec b = parse_address_spec("192.168.0.10/32");
    REQUIRE(boost::get<address_v4>(&b) != nullptr);
    REQUIRE(boost::get<address_v4>(b) == ip("192.168.0.10"));

    address_spec c = parse_address_spec("10.1.2.3/255.255.255.255");
    REQUIRE(boost::get<address_v4>(&c) != nullptr);
}

TEST_CASE("ranges are canonicalized", "[address]") {
    address_spec a = parse_address_spec("192.168.0.10/24");
    REQUIRE(boost::get<network_v4>(&a) != nullptr);
    REQUIRE(to_string(a) == "192.168.0.0/24");

    address_spec b = parse_address_spec("172.16.5.4/255.255.0.0");
    REQUIRE(to_string(b) == "172.16.0.0/16");

    address_spec all = parse_address_spec("0.0.0.0/0");
    REQUIRE(boost::get<network_v4>(&all) != nullptr);
    REQUIRE(contains(boost::get<network_v4>(all), ip("8.8.8.8")));
}

TEST_CASE("shortened ranges", "[address]") {
    REQUIRE(to_string(parse_address_spec("192.168.0")) == "192.168.0.0/24");
    REQUIRE(to_string(parse_address_spec("192.168")) == "192.168.0.0/16");
    REQUIRE(to_string(parse_address_spec("10")) == "10.0.0.0/8");
}

TEST_CASE("range membership", "[address]") {
    network_v4 net = boost::get<network_v4>(parse_address_spec("192.168.1.0/24"));

    REQUIRE(contains(net, ip("192.168.1.9")));
    REQUIRE(contains(net, ip("192.168.1.255")));
    REQUIRE(!contains(net, ip("192.168.2.1")));
    REQUIRE(!contains(net, ip("10.0.0.5")));
}

TEST_CASE("bad addresses", "[address]") {
    REQUIRE_THROWS_AS(parse_address_spec("fe80::1"), invalid_address_family);
    REQUIRE_THROWS_AS(parse_address_spec("::1/128"), invalid_address_family);

    REQUIRE_THROWS_AS(parse_address_spec("localhost"), config_error);
    REQUIRE_THROWS_AS(parse_address_spec("192.168.0.300"), config_error);
    REQUIRE_THROWS_AS(parse_address_spec("192.168.0.1/33"), config_error);
    REQUIRE_THROWS_AS(parse_address_spec("192.168.0.1/"), config_error);
    REQUIRE_THROWS_AS(parse_address_spec("192.168.0.1/255.0.255.0"), config_error);
    REQUIRE_THROWS_AS(parse_address_spec("192.168."), config_error);
}

TEST_CASE("protocol tokens are case sensitive", "[address]") {
    REQUIRE(parse_protocol("TCP") == u_TCP);
    REQUIRE(parse_protocol("UDP") == u_UDP);
    REQUIRE(!parse_protocol("tcp"));
    REQUIRE(!parse_protocol("SCTP"));
}
