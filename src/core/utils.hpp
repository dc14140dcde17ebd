#pragma once

#include <string>
#include <optional>

// Safe integer parse: returns nullopt unless the whole string is an integer.
std::optional<int> parse_int(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Wrap a value in single quotes for a POSIX shell, escaping embedded quotes.
std::string shell_quote(const std::string& value);

// Expand a leading "~/" to the home directory. Other paths pass through.
std::string expand_home(const std::string& path);

// Decode bytes as UTF-8. Every invalid or truncated sequence becomes U+FFFD;
// never fails.
std::string decode_utf8_lossy(const std::string& bytes);
