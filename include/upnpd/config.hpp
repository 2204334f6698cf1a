#ifndef _UPNPD_CONFIG_HPP
#define _UPNPD_CONFIG_HPP

#include "util.hpp"
#include "error.hpp"
#include "mapping.hpp"

namespace upnpd {

enum config_format {
    f_CSV,
    f_JSON
};

boost::optional<config_format> parse_format(const std::string&);
std::string format_name(config_format);

/// @brief csv with a mandatory header line naming the columns
/// (address, port, protocol, duration, comment). columns may come in any
/// order, unknown columns are ignored and address may be left out.
/// broken records are logged and skipped.
/// @throws config_error if the header lacks a required column
std::vector<mapping_request> parse_csv(std::istream&, char);

/// @brief json array of objects with the same keys as the csv columns.
/// address may be null or missing, unknown keys are ignored
/// @throws config_error if the input is not a json array
std::vector<mapping_request> parse_json(std::istream&);

/// @brief where the mapping list comes from. re-read on every pass so the
/// file can be edited while the daemon runs. "-" reads stdin once and keeps
/// it in memory
class config_source {
public:
    config_source(const std::string&, config_format, char, std::istream& = std::cin);

    static config_source from_string(const std::string&, config_format, char = constants::default_csv_delimiter);

    /// @throws config_error
    std::vector<mapping_request> load() const;

    std::string origin() const;

private:
    config_source(config_format, char);

    config_format format;
    char delimiter;
    std::string path;
    boost::optional<std::string> buffer;
};

}

#endif
