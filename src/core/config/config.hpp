#pragma once
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

static constexpr const char* DEFAULT_CONFIG_PATH = "supervisor.toml";
static constexpr const char* DEFAULT_SESSION_NAME = "spines_queue";
static constexpr unsigned int DEFAULT_TMUX_TIMEOUT_MS = 5000;
static constexpr unsigned int DEFAULT_LOCK_TIMEOUT_MS = 10000;
static constexpr unsigned int WORKER_POLL_SECONDS = 2;

class ConfigError : public std::runtime_error {
 public:
    using std::runtime_error::runtime_error;
};

struct SessionConfig {
    std::string name = DEFAULT_SESSION_NAME;
    std::string socket;     // tmux -L <socket>; empty means the default server
    std::string lock_path;  // empty means a per-session file in the temp directory
    unsigned int lock_timeout_ms = DEFAULT_LOCK_TIMEOUT_MS;
    unsigned int startup_grace_ms = 0;  // 0 disables the post-launch liveness check
};

struct WorkerConfig {
    std::vector<std::string> command;
    std::string working_dir;
    std::string output_log;
    std::map<std::string, std::string> env;
};

struct PathsConfig {
    std::string launch_log;
    std::vector<std::string> ensure_dirs;
};

struct TmuxConfig {
    std::string binary = "tmux";
    unsigned int timeout_ms = DEFAULT_TMUX_TIMEOUT_MS;
};

struct SupervisorConfig {
    SessionConfig session;
    WorkerConfig worker;
    PathsConfig paths;
    TmuxConfig tmux;
};

/**
 * @brief Built-in deployment: the SpinesGUI queue worker under ~/code/SpinesGUI.
 * @param home Home directory used to anchor the project paths.
 */
SupervisorConfig DefaultConfig(const std::string& home);

/**
 * @brief Loads configuration from a TOML file on top of DefaultConfig(home).
 * @param path Path to the .toml file (default: "supervisor.toml")
 * @param home Replaces a leading "~" in path-valued settings.
 * @return Parsed and validated SupervisorConfig.
 * @throws ConfigError if the file cannot be parsed or fails validation.
 */
SupervisorConfig LoadConfig(const std::string& path = DEFAULT_CONFIG_PATH,
                            const std::string& home = "");

// Throws ConfigError on an empty session name, command or launch log path.
void ValidateConfig(const SupervisorConfig& config);

std::string ExpandHome(const std::string& path, const std::string& home);

// Lock file guarding the check-and-create step for config.session.name.
std::string ResolveLockPath(const SupervisorConfig& config);
