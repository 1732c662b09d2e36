#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

class LockTimeout : public std::runtime_error {
 public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief RAII exclusive lock on a file, shared between processes via flock(2).
 * Blocks up to the timeout on construction. The lock is released on
 * destruction, and by the kernel if the holder dies.
 */
class LockFile {
   public:
    // Throws LockTimeout if the lock is still held elsewhere after timeout,
    // std::system_error if the file cannot be opened.
    LockFile(std::string path, std::chrono::milliseconds timeout);
    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
    LockFile(LockFile&&) = delete;
    LockFile& operator=(LockFile&&) = delete;

   private:
    std::string path_;
    int fd_ = -1;
};
