#include "cli.hpp"

namespace upnpd {

namespace po = boost::program_options;

po::options_description cli_description() {
    po::options_description d("Options");
    d.add_options()
        ("file,f", po::value<std::string>()->value_name("FILE"),
            "The file (or \"-\" for stdin) with the port descriptions")
        ("format", po::value<std::string>()->default_value("csv")->value_name("FORMAT"),
            "The format of the configuration file (csv, json)")
        ("csv-delimiter,d", po::value<std::string>()->default_value(std::string(1, constants::default_csv_delimiter))->value_name("CHAR"),
            "Field delimiter when using CSV files")
        ("foreground,F", po::bool_switch(), "Run in foreground instead of forking to background")
        ("oneshot,1", po::bool_switch(), "Run just one time instead of continuously")
        ("interval,n", po::value<u64>()->default_value(constants::default_interval)->value_name("SECONDS"),
            "Update interval in seconds")
        ("close-ports-on-exit", po::bool_switch(), "Close specified ports on program exit")
        ("only-close-ports", po::bool_switch(), "Only close specified ports and exit")
        ("pid-file", po::value<std::string>()->default_value(constants::default_pid_file)->value_name("PID_FILE"),
            "Absolute path to PID file for daemon mode")
        ("discover-timeout", po::value<int>()->default_value(constants::discover_timeout_ms)->value_name("MS"),
            "How long to wait for gateways to answer, in milliseconds")
        ("log-level,l", po::value<std::string>()->default_value(constants::default_log_level)->value_name("LEVEL"),
            "trace, debug, info, warning, error, critical or off (SPDLOG_LEVEL overrides)")
        ("help,h", "Print help")
        ("version,V", "Print version");
    return d;
}

cli_action parse_command_line(int argc, const char* const argv[], cli_options& o) {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, cli_description()), vm);
    po::notify(vm);

    if(vm.count("help"))
        return a_HELP;

    if(vm.count("version"))
        return a_VERSION;

    if(!vm.count("file"))
        throw po::required_option("file");
    o.file = vm["file"].as<std::string>();

    std::string format = vm["format"].as<std::string>();
    boost::optional<config_format> f = parse_format(format);
    if(!f)
        throw po::invalid_option_value(format);
    o.format = *f;

    std::string delim = vm["csv-delimiter"].as<std::string>();
    if(delim.size() != 1)
        throw po::invalid_option_value(delim);
    o.csv_delimiter = delim[0];

    o.foreground = vm["foreground"].as<bool>();
    o.schedule.oneshot = vm["oneshot"].as<bool>();
    o.schedule.close_ports_on_exit = vm["close-ports-on-exit"].as<bool>();
    o.schedule.only_close_ports = vm["only-close-ports"].as<bool>();

    o.schedule.interval = vm["interval"].as<u64>();
    if(o.schedule.interval == 0 || o.schedule.interval > constants::max_interval)
        throw po::invalid_option_value(std::to_string(o.schedule.interval));

    o.pid_file = vm["pid-file"].as<std::string>();
    if(o.pid_file.empty() || o.pid_file[0] != '/')
        throw po::error(fmt::format("the PID file must be given as an absolute path, got '{}'", o.pid_file));

    o.discover_timeout = vm["discover-timeout"].as<int>();
    if(o.discover_timeout <= 0)
        throw po::invalid_option_value(std::to_string(o.discover_timeout));

    o.log_level = vm["log-level"].as<std::string>();
    if(spdlog::level::from_str(o.log_level) == spdlog::level::off && o.log_level != "off")
        throw po::invalid_option_value(o.log_level);

    return a_RUN;
}

}
