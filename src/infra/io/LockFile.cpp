#include "LockFile.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <thread>
#include <utility>

#include "spdlog/spdlog.h"

namespace {
constexpr auto LOCK_RETRY_INTERVAL = std::chrono::milliseconds(20);
}

LockFile::LockFile(std::string path, std::chrono::milliseconds timeout) : path_(std::move(path)) {
    // O_CLOEXEC: children spawned while the lock is held (tmux) must not inherit it
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        throw std::system_error(errno, std::generic_category(), "open lock file " + path_);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool waited = false;
    for (;;) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            break;
        }
        const int err = errno;
        if (err == EINTR) {
            continue;
        }
        if (err != EWOULDBLOCK) {
            ::close(fd_);
            fd_ = -1;
            throw std::system_error(err, std::generic_category(), "flock " + path_);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd_);
            fd_ = -1;
            throw LockTimeout("Timed out waiting for lock " + path_);
        }
        if (!waited) {
            spdlog::debug("Lock {} is held by another supervisor, waiting...", path_);
            waited = true;
        }
        std::this_thread::sleep_for(LOCK_RETRY_INTERVAL);
    }
    spdlog::trace("Acquired lock {}", path_);
}

LockFile::~LockFile() {
    if (fd_ != -1) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        spdlog::trace("Released lock {}", path_);
    }
}
