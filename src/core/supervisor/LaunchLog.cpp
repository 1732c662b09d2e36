#include "LaunchLog.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "spdlog/spdlog.h"

LaunchLog::LaunchLog(std::string path) : path_(std::move(path)) {
    Open();
}

LaunchLog::~LaunchLog() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

bool LaunchLog::Open() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        spdlog::warn("Launch log '{}' is not writable: {}", path_, std::strerror(errno));
        return false;
    }
    return true;
}

bool LaunchLog::Append(const LaunchRecord& record) {
    std::string line = FormatLaunchRecord(record);
    line.push_back('\n');

    // Retry the open once per record; the directory may have appeared since.
    if (fd_ == -1 && !Open()) {
        degraded_ = true;
        spdlog::warn("[launch-log fallback] {}", line.substr(0, line.size() - 1));
        return false;
    }

    ssize_t written = -1;
    do {
        written = ::write(fd_, line.data(), line.size());
    } while (written == -1 && errno == EINTR);

    if (written != static_cast<ssize_t>(line.size())) {
        degraded_ = true;
        spdlog::warn("Write to launch log '{}' failed: {}", path_,
                     written == -1 ? std::strerror(errno) : "short write");
        spdlog::warn("[launch-log fallback] {}", line.substr(0, line.size() - 1));
        return false;
    }
    return true;
}
