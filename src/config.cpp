#include "config.hpp"

#include <fstream>
#include <filesystem>
#include <map>
#include <set>

#include <boost/tokenizer.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace upnpd {

boost::optional<config_format> parse_format(const std::string& s) {
    if(s == "csv") return f_CSV;
    if(s == "json") return f_JSON;
    return boost::none;
}

std::string format_name(config_format f) {
    switch(f) {
    case f_CSV: return "csv";
    case f_JSON: return "json";
    default: return "unknown";
    }
}

namespace {

const char* const required_fields[] = { "port", "protocol", "duration", "comment" };
const std::set<std::string> known_fields = { "address", "port", "protocol", "duration", "comment" };

/// @brief build a request from named raw fields, missing address means any
mapping_request make_request(const std::map<std::string, std::string>& f) {
    for(const char* name : required_fields) {
        if(!f.count(name))
            throw config_error(fmt::format("missing field '{}'", name));
    }

    mapping_request r;

    auto a = f.find("address");
    r.address = a == f.end() ? address_spec(any_address{}) : parse_address_spec(a->second);

    boost::optional<u64> port = util::parse_uint(util::trim(f.at("port")));
    if(!port || *port == 0 || *port > 65535)
        throw config_error(fmt::format("invalid port '{}'", f.at("port")));
    r.port = static_cast<u16>(*port);

    boost::optional<t_protocol> proto = parse_protocol(util::trim(f.at("protocol")));
    if(!proto)
        throw config_error(fmt::format("invalid protocol '{}', expected TCP or UDP", f.at("protocol")));
    r.protocol = *proto;

    boost::optional<u64> duration = util::parse_uint(util::trim(f.at("duration")));
    if(!duration || *duration > std::numeric_limits<u32>::max())
        throw config_error(fmt::format("invalid duration '{}'", f.at("duration")));
    r.duration = static_cast<u32>(*duration);

    r.comment = f.at("comment");

    return r;
}

}

std::vector<mapping_request> parse_csv(std::istream& in, char delimiter) {
    typedef boost::tokenizer<boost::escaped_list_separator<char>> tokenizer;
    boost::escaped_list_separator<char> sep('\\', delimiter, '"');

    std::vector<mapping_request> res;
    std::vector<std::string> header;
    std::string line;
    int record = 0;

    while(std::getline(in, line)) {
        if(!line.empty() && line.back() == '\r')
            line.pop_back();

        if(util::trim(line).empty())
            continue;

        if(header.empty()) {
            try {
                tokenizer tok(line, sep);
                for(const std::string& t : tok)
                    header.push_back(util::trim(t));
            } catch(boost::escaped_list_error& e) {
                throw config_error(fmt::format("malformed CSV header: {}", e.what()));
            }

            for(const char* name : required_fields) {
                if(std::find(header.begin(), header.end(), name) == header.end())
                    throw config_error(fmt::format("CSV header is missing column '{}'", name));
            }

            continue;
        }

        record++;

        try {
            tokenizer tok(line, sep);
            std::vector<std::string> fields(tok.begin(), tok.end());

            if(fields.size() != header.size()) {
                throw config_error(fmt::format("found record with {} fields, but the header has {} fields",
                    fields.size(), header.size()));
            }

            std::map<std::string, std::string> named;
            for(std::size_t i = 0; i < header.size(); i++)
                named[header[i]] = fields[i];

            res.push_back(make_request(named));
        } catch(std::runtime_error& e) {
            // escaped_list_error included
            spdlog::error("config: CSV record {}: {}", record, e.what());
        }
    }

    return res;
}

std::vector<mapping_request> parse_json(std::istream& in) {
    namespace pt = boost::property_tree;

    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();

    // ptree can't tell [] from {}, look at the document itself
    auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    if(first == text.end() || *first != '[')
        throw config_error("input is not a JSON array");

    pt::ptree root;
    try {
        std::istringstream is(text);
        pt::read_json(is, root);
    } catch(pt::json_parser_error& e) {
        throw config_error(fmt::format("invalid JSON: {}", e.what()));
    }

    std::vector<mapping_request> res;
    int record = 0;

    for(const auto& element : root) {
        record++;

        try {
            const pt::ptree& obj = element.second;
            if(obj.empty() && !obj.data().empty())
                throw config_error("element is not an object");

            std::map<std::string, std::string> named;
            for(const auto& kv : obj) {
                if(kv.first.empty())
                    throw config_error("element is not an object");
                if(!kv.second.empty()) {
                    if(known_fields.count(kv.first))
                        throw config_error(fmt::format("field '{}' must be a scalar", kv.first));
                    continue; // nested values of unknown keys are ignored
                }
                named[kv.first] = kv.second.data();
            }

            // null and missing both mean any address
            auto a = named.find("address");
            if(a != named.end() && a->second == "null")
                named.erase(a);

            res.push_back(make_request(named));
        } catch(std::runtime_error& e) {
            spdlog::error("config: JSON element {}: {}", record, e.what());
        }
    }

    return res;
}

config_source::config_source(config_format f, char d) :
    format(f), delimiter(d) { }

config_source::config_source(const std::string& p, config_format f, char d, std::istream& in) :
    format(f), delimiter(d) {
    if(p == "-") {
        std::stringstream ss;
        ss << in.rdbuf();
        buffer = ss.str();
        return;
    }

    // the daemon leaves the working directory, keep an absolute path
    std::error_code ec;
    std::filesystem::path c = std::filesystem::canonical(p, ec);
    if(ec)
        throw config_error(fmt::format("cannot use config file '{}': {}", p, ec.message()));
    path = c.string();
}

config_source config_source::from_string(const std::string& text, config_format f, char d) {
    config_source s(f, d);
    s.buffer = text;
    return s;
}

std::vector<mapping_request> config_source::load() const {
    std::unique_ptr<std::istream> in;
    if(buffer) {
        in = std::make_unique<std::istringstream>(*buffer);
    } else {
        auto f = std::make_unique<std::ifstream>(path);
        if(!f->is_open())
            throw config_error(fmt::format("cannot open config file '{}'", path));
        in = std::move(f);
    }

    std::vector<mapping_request> res = format == f_CSV ?
        parse_csv(*in, delimiter) : parse_json(*in);

    spdlog::debug("config: {} mapping(s) read from {}", res.size(), origin());

    return res;
}

std::string config_source::origin() const {
    return buffer ? "stdin" : path;
}

}
