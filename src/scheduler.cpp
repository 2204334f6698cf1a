#include "scheduler.hpp"
#include "interfaces.hpp"
#include "upnp.hpp"

#include <csignal>

namespace upnpd {

template <typename Gateway, typename Interfaces>
scheduler<Gateway, Interfaces>::scheduler(const scheduler_options& o, const config_source& s, Gateway& g, Interfaces& i) :
    opts(o), source(s), rec(g, i), signals(ioc, SIGINT, SIGTERM), timer(ioc) { }

template <typename Gateway, typename Interfaces>
int scheduler<Gateway, Interfaces>::run() {
    signals.async_wait([this](const boost::system::error_code& ec, int sig) {
        if(ec)
            return;

        spdlog::info("scheduler: signal {} received, quitting", sig);
        stopping = true;
        timer.cancel();
    });

    boost::asio::post(ioc, [this]() { tick(); });

    ioc.run();

    return status;
}

template <typename Gateway, typename Interfaces>
void scheduler<Gateway, Interfaces>::stop() {
    boost::asio::post(ioc, [this]() {
        stopping = true;
        timer.cancel();
    });
}

template <typename Gateway, typename Interfaces>
void scheduler<Gateway, Interfaces>::tick() {
    if(stopping) {
        finish();
        return;
    }

    if(!opts.only_close_ports) {
        std::vector<mapping_request> requests;
        try {
            requests = source.load();
        } catch(config_error& e) {
            // no point in going on, and nothing we can close either
            spdlog::critical("scheduler: {}", e.what());
            status = EXIT_FAILURE;
            signals.cancel();
            return;
        }

        std::vector<operation_outcome> out = rec.apply(requests);
        passes_++;

        std::size_t failed = std::count_if(out.begin(), out.end(),
            [](const operation_outcome& o) { return !o.ok(); });

        if(failed > 0) {
            spdlog::warn("scheduler: {} of {} mapping(s) failed in pass {}", failed, out.size(), passes_);
            if(opts.oneshot)
                status = EXIT_FAILURE;
        } else {
            spdlog::debug("scheduler: pass {} done, {} mapping(s) applied", passes_, out.size());
        }
    }

    if(opts.oneshot || opts.only_close_ports) {
        finish();
        return;
    }

    timer.expires_after(seconds(opts.interval));
    timer.async_wait([this](const boost::system::error_code&) {
        // cancelled means stopping is set, tick handles both
        tick();
    });
}

template <typename Gateway, typename Interfaces>
void scheduler<Gateway, Interfaces>::finish() {
    signals.cancel();
    timer.cancel();

    if(!opts.close_ports_on_exit && !opts.only_close_ports)
        return;

    try {
        rec.withdraw(source.load());
    } catch(config_error& e) {
        spdlog::critical("scheduler: cannot close ports: {}", e.what());
        status = EXIT_FAILURE;
    }
}

EINST(scheduler, upnp_client, interface_enumerator);
EINST(scheduler, test::mock_gateway, test::mock_interfaces);

}
