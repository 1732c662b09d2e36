#include "TmuxSessionManager.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <future>
#include <string_view>
#include <utility>

#include "ShellQuote.hpp"

namespace bp = boost::process;

namespace {

std::string ExactTarget(const std::string& name) { return "=" + name; }

bool Contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

// tmux reports an absent session, or no server at all, with exit status 1
bool MeansNoSession(const std::string& err) {
    // a stale socket left by an exited server refuses connections
    return Contains(err, "can't find session") || Contains(err, "no server running") ||
           (Contains(err, "error connecting to") &&
            (Contains(err, "No such file or directory") || Contains(err, "Connection refused")));
}

// tmux splits argument lists on a trailing ';', a trailing "\;" keeps it literal
std::string EscapeCommandSeparator(const std::string& arg) {
    if (arg.empty() || arg.back() != ';') {
        return arg;
    }
    return arg.substr(0, arg.size() - 1) + "\\;";
}

boost::filesystem::path ResolveBinary(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        boost::system::error_code ec;
        if (boost::filesystem::is_regular_file(binary, ec)) {
            return binary;
        }
        return {};
    }
    return bp::search_path(binary);
}

}  // namespace

TmuxSessionManager::TmuxSessionManager(const TmuxConfig& cfg, std::string socket)
    : binary_(cfg.binary),
      exe_(ResolveBinary(cfg.binary)),
      socket_(std::move(socket)),
      timeout_(cfg.timeout_ms) {
    if (exe_.empty()) {
        spdlog::debug("tmux binary '{}' not found.", binary_);
    } else {
        spdlog::debug("Using tmux at {}", exe_.string());
    }
}

std::vector<std::string> TmuxSessionManager::BaseArgs() const {
    std::vector<std::string> args;
    if (!socket_.empty()) {
        args.insert(args.end(), {"-L", socket_});
    }
    return args;
}

TmuxSessionManager::Result TmuxSessionManager::Run(const std::vector<std::string>& args) const {
    if (exe_.empty()) {
        throw SessionManagerUnavailable("tmux binary '" + binary_ + "' not found");
    }

    spdlog::trace("tmux {}", JoinCommand(args));

    boost::asio::io_context ioc;
    std::future<std::string> err;
    bp::child child;
    try {
        child = bp::child(exe_, bp::args(args), bp::std_in < bp::null, bp::std_out > bp::null,
                          bp::std_err > err, ioc);
    } catch (const bp::process_error& e) {
        throw SessionManagerUnavailable(std::string("failed to run tmux: ") + e.what());
    }

    // Returns early once stderr reaches EOF
    ioc.run_for(timeout_);
    if (!ioc.stopped()) {
        std::error_code ec;
        child.terminate(ec);
        throw SessionManagerUnavailable("tmux did not respond within " + std::to_string(timeout_.count()) +
                                        " ms");
    }

    std::error_code ec;
    child.wait(ec);
    if (ec) {
        throw SessionManagerUnavailable("waiting for tmux failed: " + ec.message());
    }

    Result result;
    result.exit_code = child.exit_code();
    result.err = err.get();
    while (!result.err.empty() && (result.err.back() == '\n' || result.err.back() == '\r')) {
        result.err.pop_back();
    }
    return result;
}

bool TmuxSessionManager::HasSession(const std::string& name) {
    auto args = BaseArgs();
    args.insert(args.end(), {"has-session", "-t", ExactTarget(name)});

    Result res = Run(args);
    if (res.exit_code == 0) {
        return true;
    }
    if (MeansNoSession(res.err)) {
        return false;
    }
    throw SessionManagerUnavailable("tmux has-session failed (exit " + std::to_string(res.exit_code) +
                                    "): " + res.err);
}

std::vector<std::string> TmuxSessionManager::NewSessionArgs(const std::string& name,
                                                            const LaunchSpec& spec) const {
    auto args = BaseArgs();
    args.insert(args.end(), {"new-session", "-d", "-s", name});
    if (!spec.working_dir.empty()) {
        args.insert(args.end(), {"-c", spec.working_dir});
    }
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    // With more than one word after "--" tmux execs them directly, no shell
    args.push_back("--");
    for (const auto& arg : spec.argv) {
        args.push_back(EscapeCommandSeparator(arg));
    }
    // Chained into the same command list so the pipe is attached before the
    // worker can write or exit
    if (!spec.output_log.empty()) {
        args.insert(args.end(), {";", "pipe-pane", "-o", "-t", ExactTarget(name) + ":",
                                 "exec cat >> " + ShellQuote(spec.output_log)});
    }
    return args;
}

bool TmuxSessionManager::CreateSession(const std::string& name, const LaunchSpec& spec) {
    Result res = Run(NewSessionArgs(name, spec));
    if (res.exit_code != 0) {
        if (Contains(res.err, "duplicate session")) {
            spdlog::debug("[{}] tmux reports duplicate session.", name);
            return false;
        }
        if (!spec.output_log.empty() && Contains(res.err, "can't find")) {
            // Session was created, the worker exited before pipe-pane ran
            spdlog::warn("[{}] Worker exited before its output could be captured: {}", name, res.err);
            return true;
        }
        throw SessionManagerUnavailable("tmux new-session failed (exit " + std::to_string(res.exit_code) +
                                        "): " + res.err);
    }

    if (!spec.output_log.empty()) {
        spdlog::debug("[{}] Worker output appended to {}", name, spec.output_log);
    }
    return true;
}

void TmuxSessionManager::StopSession(const std::string& name) {
    auto args = BaseArgs();
    args.insert(args.end(), {"kill-session", "-t", ExactTarget(name)});

    Result res = Run(args);
    if (res.exit_code != 0 && !MeansNoSession(res.err)) {
        throw SessionManagerUnavailable("tmux kill-session failed (exit " + std::to_string(res.exit_code) +
                                        "): " + res.err);
    }
    spdlog::info("[{}] Session stopped.", name);
}
