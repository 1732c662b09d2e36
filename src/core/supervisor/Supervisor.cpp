#include "Supervisor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>

#include "LockFile.hpp"
#include "ShellQuote.hpp"

std::string_view ToString(LaunchStatus status) {
    switch (status) {
        case LaunchStatus::Started: return "Started";
        case LaunchStatus::AlreadyRunning: return "AlreadyRunning";
        case LaunchStatus::ExitedEarly: return "ExitedEarly";
    }
    return "Unknown";
}

LaunchSpec MakeLaunchSpec(const WorkerConfig& worker) {
    LaunchSpec spec;
    spec.argv = worker.command;
    spec.working_dir = worker.working_dir;
    spec.env = worker.env;
    spec.output_log = worker.output_log;
    return spec;
}

void PrepareDirectories(const std::vector<std::string>& dirs) {
    for (const auto& dir : dirs) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            spdlog::warn("Failed to create directory {}: {}", dir, ec.message());
        } else {
            spdlog::debug("Directory {} ready.", dir);
        }
    }
}

LaunchOutcome EnsureRunning(const SupervisorConfig& config, ISessionManager& sessions, LaunchLog& log) {
    const std::string& name = config.session.name;
    LaunchOutcome outcome{LaunchStatus::Started};

    auto record = [&](LaunchEvent event, std::string command = {}) {
        LaunchRecord entry{std::chrono::system_clock::now(), event, name, std::move(command)};
        if (!log.Append(entry)) {
            outcome.log_degraded = true;
        }
    };

    // 1. Audit the invocation itself
    record(LaunchEvent::Invoked);
    spdlog::debug("[{}] EnsureRunning invoked.", name);

    // 2. Check and create as one step
    {
        LockFile lock(ResolveLockPath(config), std::chrono::milliseconds(config.session.lock_timeout_ms));

        if (sessions.HasSession(name)) {
            spdlog::info("[{}] Worker already running.", name);
            record(LaunchEvent::AlreadyRunning);
            outcome.status = LaunchStatus::AlreadyRunning;
            return outcome;
        }

        LaunchSpec spec = MakeLaunchSpec(config.worker);
        const std::string command = JoinCommand(spec.argv);
        spdlog::info("[{}] Starting worker: {}", name, command);

        if (!sessions.CreateSession(name, spec)) {
            // Created by someone not going through this lock
            spdlog::warn("[{}] Session appeared while starting, treating as already running.", name);
            record(LaunchEvent::AlreadyRunning);
            outcome.status = LaunchStatus::AlreadyRunning;
            return outcome;
        }

        record(LaunchEvent::Started, command);
        spdlog::info("[{}] Started worker session.", name);
    }

    // 3. Optional post-launch liveness check, outside the lock
    if (config.session.startup_grace_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config.session.startup_grace_ms));
        if (!sessions.HasSession(name)) {
            spdlog::error("[{}] Worker session exited within {} ms of launch.", name,
                          config.session.startup_grace_ms);
            record(LaunchEvent::ExitedEarly);
            outcome.status = LaunchStatus::ExitedEarly;
            return outcome;
        }
        spdlog::debug("[{}] Session still alive after {} ms.", name, config.session.startup_grace_ms);
    }

    return outcome;
}
