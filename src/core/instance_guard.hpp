#pragma once

#include <string>

namespace intraday {

/**
 * Exclusive flock on the account lock file, held for the process lifetime.
 * The holder's pid is written into the file. A second holder fails with
 * InstanceConflict. The lock is released by the kernel if the process dies.
 */
class InstanceGuard {
public:
    explicit InstanceGuard(const std::string& lock_path);
    ~InstanceGuard();

    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_{-1};
};

} // namespace intraday
