#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when the session facility cannot be queried or invoked
 * (binary missing, spawn failure, unexpected error, timeout).
 */
class SessionManagerUnavailable : public std::runtime_error {
 public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Everything needed to start the worker inside a new session.
 * The command is an argument vector; nothing is passed through a shell.
 */
struct LaunchSpec {
    std::vector<std::string> argv;
    std::string working_dir;                  // empty: inherit
    std::map<std::string, std::string> env;   // extra variables for the session
    std::string output_log;                   // empty: pane output is not captured
};

/**
 * @brief Contract for an OS-level manager of named, detached sessions.
 * * @details
 * **Pattern:** Strategy. The tmux backend is used in production, tests
 * substitute an in-memory fake.
 * **Thread Safety:** Implementations are not required to be thread-safe;
 * callers serialize check-and-create through a LockFile.
 */
struct ISessionManager {
    virtual ~ISessionManager() = default;

    // Live status query. Must not create, modify or destroy anything.
    virtual bool HasSession(const std::string& name) = 0;

    // Creates a detached session running spec.argv until it exits on its own.
    // Returns false if a session with that name already exists.
    virtual bool CreateSession(const std::string& name, const LaunchSpec& spec) = 0;

    // Destroys the session if present. Absent sessions are not an error.
    virtual void StopSession(const std::string& name) = 0;
};
