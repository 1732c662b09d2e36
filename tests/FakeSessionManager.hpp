#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "ISessionManager.hpp"

// In-memory session table. Check and create are separate critical sections,
// so callers racing without a lock would both see the name as free.
class FakeSessionManager : public ISessionManager {
   public:
    bool HasSession(const std::string& name) override {
        ++has_calls;
        if (!available) {
            throw SessionManagerUnavailable("fake tmux is not installed");
        }
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            found = sessions_.count(name) > 0;
        }
        if (query_delay.count() > 0) {
            std::this_thread::sleep_for(query_delay);
        }
        return found;
    }

    bool CreateSession(const std::string& name, const LaunchSpec& spec) override {
        ++create_calls;
        if (!available) {
            throw SessionManagerUnavailable("fake tmux is not installed");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        last_spec = spec;
        if (sessions_.count(name) > 0) {
            if (reject_duplicates) {
                return false;
            }
            ++duplicates_created;
        }
        if (!worker_exits_immediately) {
            sessions_.insert(name);
        }
        return true;
    }

    void StopSession(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(name);
    }

    void Seed(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.insert(name);
    }

    std::size_t live_sessions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

    // knobs
    std::atomic<bool> available{true};
    std::atomic<bool> reject_duplicates{true};
    std::atomic<bool> worker_exits_immediately{false};
    std::chrono::milliseconds query_delay{0};

    // observations
    std::atomic<int> has_calls{0};
    std::atomic<int> create_calls{0};
    std::atomic<int> duplicates_created{0};
    LaunchSpec last_spec;

   private:
    std::mutex mutex_;
    std::multiset<std::string> sessions_;
};
