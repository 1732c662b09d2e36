#include "ShellQuote.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool IsSafeChar(unsigned char c) {
    if (std::isalnum(c) != 0) {
        return true;
    }
    switch (c) {
        case '_': case '@': case '%': case '+': case '=':
        case ':': case ',': case '.': case '/': case '-':
            return true;
        default:
            return false;
    }
}

}  // namespace

std::string ShellQuote(std::string_view word) {
    if (!word.empty() && std::all_of(word.begin(), word.end(),
                                     [](char c) { return IsSafeChar(static_cast<unsigned char>(c)); })) {
        return std::string(word);
    }

    std::string quoted;
    quoted.reserve(word.size() + 2);
    quoted.push_back('\'');
    for (char c : word) {
        if (c == '\'') {
            // close, escaped quote, reopen
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line.push_back(' ');
        }
        line += ShellQuote(arg);
    }
    return line;
}
