#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ISessionManager.hpp"
#include "LaunchLog.hpp"
#include "config.hpp"

enum class LaunchStatus {
    Started,
    AlreadyRunning,
    ExitedEarly,  // created, but gone again before startup_grace_ms elapsed
};

struct LaunchOutcome {
    LaunchStatus status;
    bool log_degraded = false;  // at least one LaunchRecord fell back to spdlog
};

std::string_view ToString(LaunchStatus status);

// Maps a WorkerConfig onto what the session manager needs to launch it.
LaunchSpec MakeLaunchSpec(const WorkerConfig& worker);

// Creates the configured directories. Failures are logged, not thrown.
void PrepareDirectories(const std::vector<std::string>& dirs);

/**
 * @brief Ensures exactly one session named config.session.name is running.
 * * @details
 * Appends an "invoked" record, then under the session's LockFile checks for
 * the session and creates it only if absent, appending "already-running" or
 * "started". Never waits for the worker itself.
 * @throws SessionManagerUnavailable if the session manager cannot be used.
 * @throws LockTimeout if another supervisor holds the lock for too long.
 */
LaunchOutcome EnsureRunning(const SupervisorConfig& config, ISessionManager& sessions, LaunchLog& log);
