#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace upnpd {

namespace {

std::string last_error() {
    return std::strerror(errno);
}

}

pid_file::pid_file(const std::string& p) : path_(p), fd(-1) {
    fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if(fd == -1)
        throw std::runtime_error(fmt::format("cannot open pid file {}: {}", path_, last_error()));

    if(::flock(fd, LOCK_EX | LOCK_NB) == -1) {
        std::string err = errno == EWOULDBLOCK ?
            fmt::format("pid file {} is locked, another instance is running", path_) :
            fmt::format("cannot lock pid file {}: {}", path_, last_error());
        ::close(fd);
        throw std::runtime_error(err);
    }

    std::string pid = std::to_string(::getpid()) + "\n";
    if(::ftruncate(fd, 0) == -1 || ::write(fd, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size())) {
        std::string err = fmt::format("cannot write pid file {}: {}", path_, last_error());
        ::close(fd);
        throw std::runtime_error(err);
    }

    spdlog::debug("process: pid {} written to {}", ::getpid(), path_);
}

pid_file::~pid_file() {
    ::unlink(path_.c_str());
    ::close(fd);
}

std::unique_ptr<pid_file> daemonize(const std::string& pid_path) {
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if(pid == -1)
        throw std::runtime_error(fmt::format("fork failed: {}", last_error()));

    if(pid > 0)
        ::_exit(EXIT_SUCCESS); // parent

    if(::setsid() == -1)
        throw std::runtime_error(fmt::format("setsid failed: {}", last_error()));

    ::umask(022);

    if(::chdir("/") == -1)
        throw std::runtime_error(fmt::format("chdir failed: {}", last_error()));

    auto p = std::make_unique<pid_file>(pid_path);

    int null = ::open("/dev/null", O_RDWR);
    if(null == -1)
        throw std::runtime_error(fmt::format("cannot open /dev/null: {}", last_error()));

    for(int target : { STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO }) {
        if(::dup2(null, target) == -1)
            throw std::runtime_error(fmt::format("cannot redirect fd {}: {}", target, last_error()));
    }

    if(null > STDERR_FILENO)
        ::close(null);

    return p;
}

}
