#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "config.hpp"

TEST(ConfigTest, DefaultsDescribeTheQueueWorker) {
    auto config = DefaultConfig("/home/lab");

    EXPECT_EQ(config.session.name, "spines_queue");
    EXPECT_EQ(config.session.startup_grace_ms, 0U);
    EXPECT_EQ(config.worker.working_dir, "/home/lab/code/SpinesGUI");
    EXPECT_EQ(config.paths.launch_log, "/home/lab/code/SpinesGUI/queue/tmux_launch.log");
    EXPECT_EQ(config.worker.output_log, "/home/lab/code/SpinesGUI/queue/worker_stdout.log");
    EXPECT_EQ(config.paths.ensure_dirs,
              (std::vector<std::string>{"/home/lab/code/SpinesGUI/queue", "/home/lab/code/SpinesGUI/queue/logs"}));

    EXPECT_EQ(config.worker.command,
              (std::vector<std::string>{"conda", "run", "--no-capture-output", "-n", "spinesGUI", "python", "-u",
                                        "worker.py", "--db", "/home/lab/code/SpinesGUI/queue/jobs.sqlite",
                                        "--poll", "2"}));
    EXPECT_NO_THROW(ValidateConfig(config));
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    TempDir dir;
    auto config = LoadConfig(dir.file("absent.toml"), "/home/lab");
    EXPECT_EQ(config.session.name, "spines_queue");
    EXPECT_EQ(config.paths.launch_log, "/home/lab/code/SpinesGUI/queue/tmux_launch.log");
}

TEST(ConfigTest, ParsesAllTables) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");
    WriteFile(path, R"(
[session]
name = "ingest"
socket = "lab"
lock_path = "~/run/ingest.lock"
lock_timeout_ms = 250
startup_grace_ms = 1500

[worker]
command = ["python", "-u", "ingest.py", "--poll", "5"]
working_dir = "~/code/ingest"
output_log = "/var/log/ingest/stdout.log"

[worker.env]
PYTHONUNBUFFERED = "1"
CONDA_DEFAULT_ENV = "ingest"

[paths]
launch_log = "~/code/ingest/launch.log"
ensure_dirs = ["~/code/ingest", "/var/log/ingest"]

[tmux]
binary = "/usr/local/bin/tmux"
timeout_ms = 900
)");

    auto config = LoadConfig(path, "/home/lab");

    EXPECT_EQ(config.session.name, "ingest");
    EXPECT_EQ(config.session.socket, "lab");
    EXPECT_EQ(config.session.lock_path, "/home/lab/run/ingest.lock");
    EXPECT_EQ(config.session.lock_timeout_ms, 250U);
    EXPECT_EQ(config.session.startup_grace_ms, 1500U);
    EXPECT_EQ(config.worker.command, (std::vector<std::string>{"python", "-u", "ingest.py", "--poll", "5"}));
    EXPECT_EQ(config.worker.working_dir, "/home/lab/code/ingest");
    EXPECT_EQ(config.worker.output_log, "/var/log/ingest/stdout.log");
    EXPECT_EQ(config.worker.env.size(), 2U);
    EXPECT_EQ(config.worker.env.at("CONDA_DEFAULT_ENV"), "ingest");
    EXPECT_EQ(config.paths.launch_log, "/home/lab/code/ingest/launch.log");
    EXPECT_EQ(config.paths.ensure_dirs, (std::vector<std::string>{"/home/lab/code/ingest", "/var/log/ingest"}));
    EXPECT_EQ(config.tmux.binary, "/usr/local/bin/tmux");
    EXPECT_EQ(config.tmux.timeout_ms, 900U);
}

TEST(ConfigTest, PartialFileKeepsDefaultsForTheRest) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");
    WriteFile(path, "[session]\nstartup_grace_ms = 2000\n");

    auto config = LoadConfig(path, "/home/lab");

    EXPECT_EQ(config.session.name, "spines_queue");
    EXPECT_EQ(config.session.startup_grace_ms, 2000U);
    EXPECT_EQ(config.tmux.binary, "tmux");
    EXPECT_FALSE(config.worker.command.empty());
}

TEST(ConfigTest, CommandArgumentsExpandHome) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");
    WriteFile(path, "[worker]\ncommand = [\"python\", \"~/worker.py\", \"--tag=~x\"]\n");

    auto config = LoadConfig(path, "/home/lab");

    EXPECT_EQ(config.worker.command, (std::vector<std::string>{"python", "/home/lab/worker.py", "--tag=~x"}));
}

TEST(ConfigTest, SyntaxErrorThrowsConfigError) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");
    WriteFile(path, "[session\nname = ");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);
}

TEST(ConfigTest, RejectsInvalidValues) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");

    WriteFile(path, "[session]\nname = \"\"\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[session]\nname = \"a:b\"\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[worker]\ncommand = []\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[worker]\ncommand = \"python worker.py\"\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[worker]\ncommand = [\"python\", 3]\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[session]\nstartup_grace_ms = -5\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[worker.env]\nDEBUG = true\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[session]\nname = \"queue/spines\"\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);
}

TEST(ConfigTest, RejectsZeroTmuxTimeout) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");
    WriteFile(path, "[tmux]\ntimeout_ms = 0\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    SupervisorConfig config = DefaultConfig("/home/lab");
    config.tmux.timeout_ms = 0;
    EXPECT_THROW(ValidateConfig(config), ConfigError);
}

TEST(ConfigTest, RejectsMillisecondsThatDoNotFitUnsigned) {
    TempDir dir;
    const auto path = dir.file("supervisor.toml");

    WriteFile(path, "[session]\nlock_timeout_ms = 4294967301\n");
    EXPECT_THROW(LoadConfig(path, "/home/lab"), ConfigError);

    WriteFile(path, "[session]\nlock_timeout_ms = 4294967295\n");
    EXPECT_EQ(LoadConfig(path, "/home/lab").session.lock_timeout_ms, 4294967295U);
}

TEST(ConfigTest, ExpandHomeOnlyTouchesLeadingTilde) {
    EXPECT_EQ(ExpandHome("~/queue", "/home/lab"), "/home/lab/queue");
    EXPECT_EQ(ExpandHome("~", "/home/lab"), "/home/lab");
    EXPECT_EQ(ExpandHome("~other/queue", "/home/lab"), "~other/queue");
    EXPECT_EQ(ExpandHome("/srv/~/queue", "/home/lab"), "/srv/~/queue");
    EXPECT_EQ(ExpandHome("~/queue", ""), "~/queue");
}

TEST(ConfigTest, LockPathDefaultsToPerSessionTempFile) {
    SupervisorConfig config;
    config.session.name = "spines_queue";
    const auto lock = ResolveLockPath(config);
    EXPECT_NE(lock.find("worker_supervisor.spines_queue.lock"), std::string::npos);

    config.session.lock_path = "/run/spines.lock";
    EXPECT_EQ(ResolveLockPath(config), "/run/spines.lock");
}
