/**
 * @file run_lock.hpp
 * @brief Exclusive lock serializing web-blocker invocations
 * @author web-blocker Development Team
 * @date 2026
 */

#pragma once

#include <string>

namespace webblock {

/**
 * @class RunLock
 * @brief RAII holder of an exclusive flock() on a lock file
 *
 * Two concurrent runs would interleave their flush and append sequences on
 * the same chain. The second process fails to acquire the lock instead of
 * waiting, so a stuck run is reported rather than queued behind.
 */
class RunLock {
public:
    /**
     * @brief Acquire the lock
     * @param path Lock file, created if missing
     * @throws std::runtime_error if the file cannot be opened or another
     *         process holds the lock
     */
    explicit RunLock(const std::string& path);

    /**
     * @brief Release the lock and close the file
     *
     * The lock file itself is left in place; removing it would let a
     * third process lock a fresh inode while the second still holds the
     * old one.
     */
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    const std::string& getPath() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
};

} // namespace webblock
