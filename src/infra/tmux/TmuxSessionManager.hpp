#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "ISessionManager.hpp"
#include "config.hpp"

/**
 * @brief ISessionManager backed by tmux.
 * * @details
 * Every operation is one short-lived tmux client process started with an
 * explicit argument vector (Boost.Process, no shell) and bounded by
 * TmuxConfig::timeout_ms. Session targets use the "=name" form so that
 * tmux never falls back to prefix matching.
 * A non-empty socket selects a private tmux server (-L).
 */
class TmuxSessionManager : public ISessionManager {
   public:
    explicit TmuxSessionManager(const TmuxConfig& cfg, std::string socket = {});

    bool HasSession(const std::string& name) override;
    bool CreateSession(const std::string& name, const LaunchSpec& spec) override;
    void StopSession(const std::string& name) override;

    // Empty when the binary could not be resolved.
    const boost::filesystem::path& executable() const { return exe_; }

    // Arguments of the tmux client call, exposed for inspection.
    std::vector<std::string> NewSessionArgs(const std::string& name, const LaunchSpec& spec) const;

   private:
    struct Result {
        int exit_code = 0;
        std::string err;
    };

    Result Run(const std::vector<std::string>& args) const;
    std::vector<std::string> BaseArgs() const;

    std::string binary_;
    boost::filesystem::path exe_;
    std::string socket_;
    std::chrono::milliseconds timeout_;
};
