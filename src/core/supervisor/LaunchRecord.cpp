#include "LaunchRecord.hpp"

#include <ctime>
#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

std::string_view ToString(LaunchEvent event) {
    switch (event) {
        case LaunchEvent::Invoked: return "invoked";
        case LaunchEvent::AlreadyRunning: return "already-running";
        case LaunchEvent::Started: return "started";
        case LaunchEvent::ExitedEarly: return "exited-early";
    }
    return "unknown";
}

std::optional<LaunchEvent> ParseLaunchEvent(std::string_view token) {
    for (auto event : {LaunchEvent::Invoked, LaunchEvent::AlreadyRunning, LaunchEvent::Started,
                       LaunchEvent::ExitedEarly}) {
        if (ToString(event) == token) {
            return event;
        }
    }
    return std::nullopt;
}

std::string FormatLaunchRecord(const LaunchRecord& record) {
    const std::time_t t = std::chrono::system_clock::to_time_t(record.timestamp);
    std::string line = fmt::format("[{:%Y-%m-%d %H:%M:%S}] {} session={}", fmt::localtime(t),
                                   ToString(record.event), record.session);
    if (record.event == LaunchEvent::Started && !record.command.empty()) {
        line += " command=" + record.command;
    }
    return line;
}
