#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <limits>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace {

std::vector<std::string> ReadStringArray(const toml::node_view<toml::node>& node,
                                         const std::string& key) {
    std::vector<std::string> out;
    const auto* arr = node.as_array();
    if (arr == nullptr) {
        throw ConfigError("'" + key + "' must be an array of strings");
    }
    for (const auto& element : *arr) {
        auto value = element.value<std::string>();
        if (!value) {
            throw ConfigError("'" + key + "' must contain only strings");
        }
        out.push_back(*value);
    }
    return out;
}

unsigned int ReadMillis(const toml::node_view<toml::node>& node, const std::string& key,
                        unsigned int fallback) {
    if (!node) {
        return fallback;
    }
    auto value = node.value<int64_t>();
    if (!value || *value < 0) {
        throw ConfigError("'" + key + "' must be a non-negative integer");
    }
    if (static_cast<uint64_t>(*value) > std::numeric_limits<unsigned int>::max()) {
        throw ConfigError("'" + key + "' is out of range");
    }
    return static_cast<unsigned int>(*value);
}

}  // namespace

std::string ExpandHome(const std::string& path, const std::string& home) {
    if (home.empty() || path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() == 1) {
        return home;
    }
    if (path[1] == '/') {
        return home + path.substr(1);
    }
    return path;
}

SupervisorConfig DefaultConfig(const std::string& home) {
    const std::filesystem::path project = std::filesystem::path(home.empty() ? "." : home) / "code" / "SpinesGUI";
    const std::filesystem::path queue = project / "queue";

    SupervisorConfig config;
    config.worker.command = {"conda", "run", "--no-capture-output", "-n", "spinesGUI",
                             "python", "-u", "worker.py",
                             "--db", (queue / "jobs.sqlite").string(),
                             "--poll", std::to_string(WORKER_POLL_SECONDS)};
    config.worker.working_dir = project.string();
    config.worker.output_log = (queue / "worker_stdout.log").string();
    config.paths.launch_log = (queue / "tmux_launch.log").string();
    config.paths.ensure_dirs = {queue.string(), (queue / "logs").string()};
    return config;
}

void ValidateConfig(const SupervisorConfig& config) {
    if (config.session.name.empty()) {
        throw ConfigError("session.name must not be empty");
    }
    // ':' and '.' are tmux target separators, '/' would leave the lock directory
    if (config.session.name.find_first_of(":./") != std::string::npos) {
        throw ConfigError("session.name must not contain ':', '.' or '/'");
    }
    if (config.worker.command.empty() || config.worker.command.front().empty()) {
        throw ConfigError("worker.command must not be empty");
    }
    if (config.paths.launch_log.empty()) {
        throw ConfigError("paths.launch_log must not be empty");
    }
    if (config.tmux.binary.empty()) {
        throw ConfigError("tmux.binary must not be empty");
    }
    if (config.tmux.timeout_ms == 0) {
        throw ConfigError("tmux.timeout_ms must be greater than 0");
    }
}

std::string ResolveLockPath(const SupervisorConfig& config) {
    if (!config.session.lock_path.empty()) {
        return config.session.lock_path;
    }
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return (dir / ("worker_supervisor." + config.session.name + ".lock")).string();
}

SupervisorConfig LoadConfig(const std::string& path, const std::string& home) {
    SupervisorConfig config = DefaultConfig(home);

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        ValidateConfig(config);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigError("Config parse error: " + std::string(err.description()));
    }

    // 1. Session Settings
    if (auto session = tbl["session"]) {
        config.session.name = session["name"].value_or(config.session.name);
        config.session.socket = session["socket"].value_or(config.session.socket);
        config.session.lock_path = ExpandHome(session["lock_path"].value_or(config.session.lock_path), home);
        config.session.lock_timeout_ms =
            ReadMillis(session["lock_timeout_ms"], "session.lock_timeout_ms", config.session.lock_timeout_ms);
        config.session.startup_grace_ms =
            ReadMillis(session["startup_grace_ms"], "session.startup_grace_ms", config.session.startup_grace_ms);
    }

    // 2. Worker Settings
    if (auto worker = tbl["worker"]) {
        if (worker["command"]) {
            config.worker.command.clear();
            for (const auto& arg : ReadStringArray(worker["command"], "worker.command")) {
                config.worker.command.push_back(ExpandHome(arg, home));
            }
        }
        config.worker.working_dir = ExpandHome(worker["working_dir"].value_or(config.worker.working_dir), home);
        config.worker.output_log = ExpandHome(worker["output_log"].value_or(config.worker.output_log), home);
        if (worker["env"]) {
            const auto* env = worker["env"].as_table();
            if (env == nullptr) {
                throw ConfigError("'worker.env' must be a table of strings");
            }
            config.worker.env.clear();
            for (auto&& [key, value] : *env) {
                auto str = value.value<std::string>();
                if (!str) {
                    throw ConfigError("'worker.env." + std::string(key.str()) + "' must be a string");
                }
                config.worker.env[std::string(key.str())] = *str;
            }
        }
    }

    // 3. Paths
    if (auto paths = tbl["paths"]) {
        config.paths.launch_log = ExpandHome(paths["launch_log"].value_or(config.paths.launch_log), home);
        if (paths["ensure_dirs"]) {
            config.paths.ensure_dirs.clear();
            for (const auto& dir : ReadStringArray(paths["ensure_dirs"], "paths.ensure_dirs")) {
                config.paths.ensure_dirs.push_back(ExpandHome(dir, home));
            }
        }
    }

    // 4. tmux
    if (auto tmux = tbl["tmux"]) {
        config.tmux.binary = ExpandHome(tmux["binary"].value_or(config.tmux.binary), home);
        config.tmux.timeout_ms = ReadMillis(tmux["timeout_ms"], "tmux.timeout_ms", config.tmux.timeout_ms);
    }

    ValidateConfig(config);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}
