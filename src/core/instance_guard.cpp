#include "instance_guard.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace intraday {

InstanceGuard::InstanceGuard(const std::string& lock_path) : path_(lock_path) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw InstanceConflict("cannot open lock file " + path_ + ": " + std::strerror(errno));
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        if (err == EWOULDBLOCK) {
            throw InstanceConflict("another engine instance holds " + path_);
        }
        throw InstanceConflict("cannot lock " + path_ + ": " + std::strerror(err));
    }

    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_, 0) != 0 || ::write(fd_, pid.data(), pid.size()) < 0) {
        spdlog::warn("Could not record pid in {}: {}", path_, std::strerror(errno));
    }
    spdlog::info("Acquired instance lock {}", path_);
}

InstanceGuard::~InstanceGuard() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

} // namespace intraday
