// 1. Standard Library
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "ISessionManager.hpp"
#include "LaunchLog.hpp"
#include "LockFile.hpp"
#include "Supervisor.hpp"
#include "TmuxSessionManager.hpp"
#include "config.hpp"

namespace {

constexpr int EXIT_SESSION_MANAGER_UNAVAILABLE = 2;
constexpr int EXIT_WORKER_EXITED_EARLY = 3;

void setup_logging() {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr size_t MAX_FILES = 3;
    std::string file_sink_error;
    try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/supervisor.log", MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
        file_sink_error = e.what();
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("supervisor", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::debug);

    if (!file_sink_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_sink_error);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    setup_logging();

    if (argc > 2) {
        spdlog::critical("Usage: worker_supervisor [config.toml]");
        spdlog::critical("Example: worker_supervisor /etc/worker_supervisor/spines_queue.toml");
        return EXIT_FAILURE;
    }

    try {
        // 1. Configuration
        const std::string config_path = argc == 2 ? argv[1] : DEFAULT_CONFIG_PATH;
        const char* home = std::getenv("HOME");
        const SupervisorConfig config = LoadConfig(config_path, home != nullptr ? home : "");

        // 2. Directories the worker and the launch log live in
        PrepareDirectories(config.paths.ensure_dirs);

        // 3. Collaborators
        LaunchLog launch_log(config.paths.launch_log);
        TmuxSessionManager tmux(config.tmux, config.session.socket);

        // 4. One idempotent start attempt
        const LaunchOutcome outcome = EnsureRunning(config, tmux, launch_log);
        if (outcome.log_degraded) {
            spdlog::warn("Launch log {} could not be fully written.", launch_log.path());
        }

        switch (outcome.status) {
            case LaunchStatus::Started:
                spdlog::info("Started worker in tmux session: {}", config.session.name);
                return EXIT_SUCCESS;
            case LaunchStatus::AlreadyRunning:
                spdlog::info("Worker already running in tmux session: {}", config.session.name);
                return EXIT_SUCCESS;
            case LaunchStatus::ExitedEarly:
                spdlog::error("Worker in tmux session {} exited right after launch.", config.session.name);
                return EXIT_WORKER_EXITED_EARLY;
        }
    } catch (const SessionManagerUnavailable& e) {
        spdlog::critical("Session manager unavailable: {}", e.what());
        return EXIT_SESSION_MANAGER_UNAVAILABLE;
    } catch (const ConfigError& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    } catch (const LockTimeout& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_FAILURE;
}
