#include "catch2/catch_all.hpp"

#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "config.hpp"

using namespace upnpd;

static std::vector<mapping_request> csv(const std::string& s, char d = ';') {
    return config_source::from_string(s, f_CSV, d).load();
}

static std::vector<mapping_request> json(const std::string& s) {
    return config_source::from_string(s, f_JSON).load();
}

TEST_CASE("csv with header", "[config]") {
    std::vector<mapping_request> r = csv(
        "address;port;protocol;duration;comment\n"
        "192.168.0.10;12345;UDP;60;Test 1\n"
        ";12346;TCP;60;Test 2\n");

    REQUIRE(r.size() == 2);

    REQUIRE(to_string(r[0].address) == "192.168.0.10");
    REQUIRE(r[0].port == 12345);
    REQUIRE(r[0].protocol == u_UDP);
    REQUIRE(r[0].duration == 60);
    REQUIRE(r[0].comment == "Test 1");

    REQUIRE(boost::get<any_address>(&r[1].address) != nullptr);
    REQUIRE(r[1].port == 12346);
    REQUIRE(r[1].protocol == u_TCP);
    REQUIRE(r[1].comment == "Test 2");
}

TEST_CASE("csv columns are matched by name", "[config]") {
    std::vector<mapping_request> r = csv(
        "comment,protocol,rationale,port,duration\r\n"
        "\"web, public\",TCP,needed,80,3600\r\n", ',');

    REQUIRE(r.size() == 1);
    REQUIRE(r[0].comment == "web, public");
    REQUIRE(r[0].port == 80);
    REQUIRE(r[0].duration == 3600);
    REQUIRE(boost::get<any_address>(&r[0].address) != nullptr);
}

TEST_CASE("empty csv input has no records", "[config]") {
    REQUIRE(csv("").empty());
    REQUIRE(csv("address;port;protocol;duration;comment\n").empty());
}

TEST_CASE("csv header must name the required columns", "[config]") {
    REQUIRE_THROWS_AS(csv("192.168.0.10;12345;UDP;60;Test 1\n"), config_error);
    REQUIRE_THROWS_AS(csv("address;port;protocol;comment\n;80;TCP;x\n"), config_error);
}

TEST_CASE("broken csv records are skipped", "[config]") {
    std::vector<mapping_request> r = csv(
        "address;port;protocol;duration;comment\n"
        ";0;TCP;60;zero port\n"
        ";70000;TCP;60;too large\n"
        ";80;tcp;60;lowercase protocol\n"
        ";81;TCP;-1;negative duration\n"
        "fe80::1;82;TCP;60;ipv6\n"
        ";83;TCP;60\n"
        "\n"
        "10.0.0.0/8;84;UDP;0;fine\n");

    REQUIRE(r.size() == 1);
    REQUIRE(r[0].port == 84);
    REQUIRE(to_string(r[0].address) == "10.0.0.0/8");
}

TEST_CASE("json array", "[config]") {
    std::vector<mapping_request> r = json(R"([
        {
            "address": "192.168.0.10",
            "port": 12345,
            "protocol": "UDP",
            "duration": 60,
            "comment": "Test 1"
        },
        {
            "address": null,
            "port": 12346,
            "protocol": "TCP",
            "duration": 60,
            "comment": "Test 2"
        },
        {
            "rationale": "This port is needed for an awesome application!",
            "may-be-deleted": false,
            "port": 12347,
            "protocol": "TCP",
            "duration": 60,
            "comment": "Test 3"
        }
    ])");

    REQUIRE(r.size() == 3);
    REQUIRE(to_string(r[0].address) == "192.168.0.10");
    REQUIRE(boost::get<any_address>(&r[1].address) != nullptr);
    REQUIRE(boost::get<any_address>(&r[2].address) != nullptr);
    REQUIRE(r[2].port == 12347);
    REQUIRE(r[2].comment == "Test 3");
}

TEST_CASE("json input must be an array", "[config]") {
    REQUIRE_THROWS_AS(json(""), config_error);
    REQUIRE_THROWS_AS(json("{}"), config_error);
    REQUIRE_THROWS_AS(json("[{\"port\": 80,"), config_error);
    REQUIRE(json("[]").empty());
}

TEST_CASE("broken json elements are skipped", "[config]") {
    std::vector<mapping_request> r = json(R"([
        { "port": 80, "protocol": "TCP", "duration": 60 },
        42,
        { "address": { "ip": "192.168.0.10" }, "port": 82, "protocol": "TCP", "duration": 60, "comment": "x" },
        { "address": [ "10.0.0.1" ], "port": 83, "protocol": "TCP", "duration": 60, "comment": "x" },
        { "port": [ 84 ], "protocol": "TCP", "duration": 60, "comment": "x" },
        { "port": 81, "protocol": "TCP", "duration": 60, "comment": "ok", "extra": { "a": 1 } }
    ])");

    REQUIRE(r.size() == 1);
    REQUIRE(r[0].port == 81);
}

TEST_CASE("stdin is read once and reused", "[config]") {
    std::istringstream in("address;port;protocol;duration;comment\n;80;TCP;60;web\n");
    config_source s("-", f_CSV, ';', in);

    REQUIRE(s.origin() == "stdin");
    REQUIRE(s.load().size() == 1);
    REQUIRE(s.load().size() == 1);
}

TEST_CASE("files are read again on every load", "[config]") {
    char name[] = "/tmp/upnpd_config_XXXXXX";
    int fd = mkstemp(name);
    REQUIRE(fd != -1);
    close(fd);

    {
        std::ofstream f(name);
        f << "address;port;protocol;duration;comment\n;80;TCP;60;web\n";
    }

    config_source s(name, f_CSV, ';');
    REQUIRE(s.load().size() == 1);

    {
        std::ofstream f(name, std::ios::app);
        f << ";443;TCP;60;tls\n";
    }

    REQUIRE(s.load().size() == 2);

    std::remove(name);
    REQUIRE_THROWS_AS(s.load(), config_error);
}

TEST_CASE("missing config file", "[config]") {
    REQUIRE_THROWS_AS(config_source("/nonexistent/upnpd.csv", f_CSV, ';'), config_error);
}
