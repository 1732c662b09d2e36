#pragma once
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Quotes one word for POSIX sh. Safe words are returned unchanged,
 * everything else is wrapped in single quotes with embedded quotes escaped.
 */
std::string ShellQuote(std::string_view word);

// Joins argv into a single human readable, copy-pasteable command line.
std::string JoinCommand(const std::vector<std::string>& argv);
