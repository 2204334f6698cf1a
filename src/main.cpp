#include "cli.hpp"
#include "config.hpp"
#include "interfaces.hpp"
#include "process.hpp"
#include "scheduler.hpp"
#include "upnp.hpp"

#include "spdlog/cfg/env.h"

int main(int argc, char** argv) {
    spdlog::set_pattern("[%P] [%H:%M:%S] [%^%l%$] %v");
    using namespace upnpd;

    cli_options opts;
    try {
        switch(parse_command_line(argc, argv, opts)) {
        case a_HELP:
            std::cout << "A daemon for continuously opening ports via UPnP.\n\n"
                << "Usage: upnpd [OPTIONS] --file <FILE>\n\n"
                << cli_description() << std::endl;
            return EXIT_SUCCESS;
        case a_VERSION:
            std::cout << "upnpd " << version << std::endl;
            return EXIT_SUCCESS;
        case a_RUN:
            break;
        }
    } catch(boost::program_options::error& e) {
        std::cerr << "error: " << e.what() << "\n\n"
            << "Usage: upnpd [OPTIONS] --file <FILE>\n\n"
            << cli_description() << std::endl;
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(opts.log_level));
    spdlog::cfg::load_env_levels();

    try {
        // stdin has to be read before it goes away in daemon mode
        config_source source(opts.file, opts.format, opts.csv_delimiter);

        std::unique_ptr<pid_file> pid;
        if(!opts.foreground)
            pid = daemonize(opts.pid_file);

        upnp_client client(opts.discover_timeout);
        interface_enumerator interfaces;

        scheduler<upnp_client, interface_enumerator> s(opts.schedule, source, client, interfaces);
        return s.run();
    } catch(std::exception& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
}
