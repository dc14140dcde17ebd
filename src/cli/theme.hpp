#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// ── Layout ──────────────────────────────────────────────

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Flag/description row for usage output
inline std::string option(const std::string& flag, const std::string& help) {
    return color::BLUE + fmt::format("    {:<24}", flag) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Strip ANSI CSI sequences, for output that is not going to a terminal
inline std::string plain(const std::string& styled) {
    std::string out;
    out.reserve(styled.size());
    for (size_t i = 0; i < styled.size(); ++i) {
        if (styled[i] == '\033' && i + 1 < styled.size() && styled[i + 1] == '[') {
            i += 2;
            while (i < styled.size() && (styled[i] < 0x40 || styled[i] > 0x7e)) ++i;
            continue;
        }
        out += styled[i];
    }
    return out;
}

} // namespace theme
