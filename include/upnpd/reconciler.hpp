#ifndef _UPNPD_RECONCILER_HPP
#define _UPNPD_RECONCILER_HPP

#include "util.hpp"
#include "mapping.hpp"
#include "resolver.hpp"

namespace upnpd {

/// @brief applies or withdraws a batch of port mappings.
///
/// requests are handled one after another in input order and every request
/// gets exactly one outcome at the same index. a failing request never stops
/// the batch. nothing is kept between calls, every call discovers again.
template <typename Gateway, typename Interfaces>
class reconciler {
public:
    reconciler(Gateway&, Interfaces&);

    /// @brief open all ports. an existing mapping on the same protocol/port is
    /// removed and the add retried once (last writer wins)
    std::vector<operation_outcome> apply(const std::vector<mapping_request>&);

    /// @brief close all ports. best effort: failures are logged and the
    /// request still counts as a success
    std::vector<operation_outcome> withdraw(const std::vector<mapping_request>&);

private:
    operation_outcome add(const mapping_request&);
    void remove(const mapping_request&);

    Gateway& gateway;
    address_resolver<Gateway, Interfaces> resolver;
};

}

#endif
