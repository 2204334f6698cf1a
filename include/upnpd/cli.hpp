#ifndef _UPNPD_CLI_HPP
#define _UPNPD_CLI_HPP

#include <boost/program_options.hpp>

#include "util.hpp"
#include "config.hpp"
#include "scheduler.hpp"

namespace upnpd {

struct cli_options {
    std::string file;
    config_format format = f_CSV;
    char csv_delimiter = constants::default_csv_delimiter;
    bool foreground = false;
    std::string pid_file = constants::default_pid_file;
    int discover_timeout = constants::discover_timeout_ms;
    std::string log_level = constants::default_log_level;
    scheduler_options schedule;
};

enum cli_action {
    a_RUN,
    a_HELP,
    a_VERSION
};

/// @throws boost::program_options::error on bad arguments
cli_action parse_command_line(int, const char* const[], cli_options&);

boost::program_options::options_description cli_description();

}

#endif
