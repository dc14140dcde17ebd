#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>

struct ParsedArgs {
    OptionLayer options;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse argv (without the program name). Accepts "--flag value" and
// "--flag=value". Errors are usage errors.
Result<ParsedArgs> parse_args(const std::vector<std::string>& args);

// Usage text for --help
std::string usage_text();
