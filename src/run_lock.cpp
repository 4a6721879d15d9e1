#include "run_lock.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace webblock {

RunLock::RunLock(const std::string& path)
    : path_(path) {
    fd_ = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Unable to open lock file " + path_ + ": " + std::strerror(errno));
    }

    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw std::runtime_error("Another web-blocker run holds " + path_);
        }
        throw std::runtime_error("Unable to lock " + path_ + ": " + std::strerror(err));
    }

    Logger::debug("RunLock", "Acquired " + path_);
}

RunLock::~RunLock() {
    if (fd_ >= 0) {
        // Closing the descriptor drops the flock
        close(fd_);
        Logger::debug("RunLock", "Released " + path_);
    }
}

} // namespace webblock
