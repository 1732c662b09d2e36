#pragma once

#include <string>

#include "LaunchRecord.hpp"

/**
 * @brief Append-only launch log, one LaunchRecord per line.
 * * @details
 * Write failures never throw: the record is reported through spdlog instead
 * and the log is marked degraded, so a broken log cannot block a launch.
 * Each line goes out in a single O_APPEND write, which keeps lines from
 * concurrent supervisors intact.
 */
class LaunchLog {
   public:
    explicit LaunchLog(std::string path);
    ~LaunchLog();

    LaunchLog(const LaunchLog&) = delete;
    LaunchLog& operator=(const LaunchLog&) = delete;

    // Returns false if the record could not be written to the file.
    bool Append(const LaunchRecord& record);

    bool degraded() const noexcept { return degraded_; }
    const std::string& path() const noexcept { return path_; }

   private:
    bool Open();

    std::string path_;
    int fd_ = -1;
    bool degraded_ = false;
};
