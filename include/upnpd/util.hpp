#ifndef _UPNPD_UTIL_HPP
#define _UPNPD_UTIL_HPP

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <string>
#include <memory>
#include <algorithm>
#include <chrono>
#include <functional>
#include <atomic>
#include <cstdlib>
#include <cctype>
#include <limits>
#include <cstdint>
#include <tuple>

#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "spdlog/spdlog.h"

#define EINST(b, ...) template class b<__VA_ARGS__>;

namespace upnpd {

typedef std::uint64_t u64;
typedef std::uint32_t u32;
typedef std::uint16_t u16;
typedef std::uint8_t u8;

using boost::asio::ip::address_v4;
using boost::asio::ip::network_v4;
using namespace std::chrono;

const std::string version = "0.7.0";

namespace constants {

const int discover_timeout_ms = 2000; // how long to wait for SSDP answers from a gateway
const int discover_ttl = 2; // multicast ttl for SSDP M-SEARCH
const u64 default_interval = 60; // seconds between passes
// longest wait the steady clock can represent
const u64 max_interval = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::duration::max()).count();
const char default_csv_delimiter = ';';
const std::string default_pid_file = "/tmp/upnpd.pid";
const std::string default_log_level = "info";

}

namespace util { // utilities

static std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return b < e ? std::string(b, e) : std::string();
}

// strict unsigned parse, no sign, no trailing garbage
static boost::optional<u64> parse_uint(const std::string& s) {
    if(s.empty())
        return boost::none;

    u64 r = 0;
    for(char c : s) {
        if(c < '0' || c > '9')
            return boost::none;

        u64 d = static_cast<u64>(c - '0');
        if(r > (std::numeric_limits<u64>::max() - d) / 10)
            return boost::none; // overflow
        r = r * 10 + d;
    }

    return r;
}

}

}

#endif
