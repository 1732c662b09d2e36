#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

enum class LaunchEvent {
    Invoked,
    AlreadyRunning,
    Started,
    ExitedEarly,
};

/**
 * @brief One append-only audit entry of a supervisor invocation.
 * Rendered as "[YYYY-MM-DD HH:MM:SS] <kind> session=<name>[ command=<cmd>]".
 */
struct LaunchRecord {
    std::chrono::system_clock::time_point timestamp;
    LaunchEvent event;
    std::string session;
    std::string command;  // only written for Started
};

std::string_view ToString(LaunchEvent event);
std::optional<LaunchEvent> ParseLaunchEvent(std::string_view token);

std::string FormatLaunchRecord(const LaunchRecord& record);
