#ifndef _UPNPD_PROCESS_HPP
#define _UPNPD_PROCESS_HPP

#include "util.hpp"

namespace upnpd {

/// @brief exclusively locked file holding our pid. only one process can hold
/// it at a time, the file is removed again when this goes away
class pid_file {
public:
    /// @throws std::runtime_error if the file can't be written or is locked
    explicit pid_file(const std::string&);
    ~pid_file();

    pid_file(const pid_file&) = delete;
    pid_file& operator=(const pid_file&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd;
};

/// @brief fork to the background and detach from the terminal. the parent
/// exits, the child continues with a fresh session, / as working directory
/// and stdio on /dev/null. the pid file is taken before stdio goes away so
/// errors still reach the terminal
std::unique_ptr<pid_file> daemonize(const std::string&);

}

#endif
