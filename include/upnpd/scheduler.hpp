#ifndef _UPNPD_SCHEDULER_HPP
#define _UPNPD_SCHEDULER_HPP

#include "util.hpp"
#include "config.hpp"
#include "reconciler.hpp"

namespace upnpd {

struct scheduler_options {
    bool oneshot = false;
    u64 interval = constants::default_interval; // seconds
    bool close_ports_on_exit = false;
    bool only_close_ports = false;
};

/// @brief drives the reconciler: one pass now, then one pass every interval
/// until SIGINT/SIGTERM or stop(). the config is read again for every pass.
/// a pass that has started always runs to the end, stopping only cuts the
/// wait between passes
template <typename Gateway, typename Interfaces>
class scheduler {
public:
    scheduler(const scheduler_options&, const config_source&, Gateway&, Interfaces&);

    /// @brief blocks until done
    /// @return process exit status
    int run();

    // safe to call from any thread
    void stop();

    u64 passes() const { return passes_; }

private:
    void tick();
    void finish();

    scheduler_options opts;
    const config_source& source;
    reconciler<Gateway, Interfaces> rec;

    boost::asio::io_context ioc;
    boost::asio::signal_set signals;
    boost::asio::steady_timer timer;

    bool stopping = false;
    int status = EXIT_SUCCESS;
    u64 passes_ = 0;
};

}

#endif
