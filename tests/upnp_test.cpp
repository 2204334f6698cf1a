#include "catch2/catch_all.hpp"

#include "upnp.hpp"

using namespace upnpd;

TEST_CASE("conflicting add is port in use", "[upnp]") {
    REQUIRE(classify_upnp_error(718, false) == mapping_error::port_in_use);
}

TEST_CASE("deleting a missing entry is not found", "[upnp]") {
    REQUIRE(classify_upnp_error(714, true) == mapping_error::not_found);
}

TEST_CASE("codes only count for their own command", "[upnp]") {
    REQUIRE(classify_upnp_error(714, false) == mapping_error::other);
    REQUIRE(classify_upnp_error(718, true) == mapping_error::other);
}

TEST_CASE("everything else is other", "[upnp]") {
    for(int r : { -3, 401, 402, 501, 606, 715, 716, 724, 725, 726, 727, 728 }) {
        INFO("result " << r);
        REQUIRE(classify_upnp_error(r, false) == mapping_error::other);
        REQUIRE(classify_upnp_error(r, true) == mapping_error::other);
    }
}

TEST_CASE("client keeps its discovery timeout", "[upnp]") {
    REQUIRE(upnp_client().timeout() == constants::discover_timeout_ms);
    REQUIRE(upnp_client(500).timeout() == 500);
}
