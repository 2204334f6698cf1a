#ifndef _UPNPD_ERROR_HPP
#define _UPNPD_ERROR_HPP

#include "util.hpp"

namespace upnpd {

/// @brief the os refused to list network interfaces
class interface_enumeration_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief an address that had to be ipv4 was not
class invalid_address_family : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief discovery failures
class gateway_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// no igd answered on a single bind address
class no_gateway_found : public gateway_error {
public:
    using gateway_error::gateway_error;
};

// every candidate bind address was tried without success
class no_matching_gateway : public gateway_error {
public:
    using gateway_error::gateway_error;
};

/// @brief add/remove failures reported by the gateway or the transport
class mapping_error : public std::runtime_error {
public:
    enum code_t {
        port_in_use, // a conflicting mapping already exists
        not_found, // no such mapping to delete
        other
    };

    mapping_error(code_t c, int upnp_code, const std::string& what) :
        std::runtime_error(what), code_(c), upnp_code_(upnp_code) { }

    code_t code() const { return code_; }
    int upnp_code() const { return upnp_code_; }

private:
    code_t code_;
    int upnp_code_;
};

/// @brief config input cannot be read or has the wrong shape
class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}

#endif
