#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Absolute path of the running executable. Falls back to
// executable_from_argv0() when the OS query fails.
std::filesystem::path executable_path(const char* argv0);

// argv0 resolved against the current directory. An empty or null argv0
// yields <cwd>/nbot-diagnose so that parent_path() is still the cwd.
std::filesystem::path executable_from_argv0(const char* argv0);

// Whether stdout / stderr are attached to a terminal.
bool stdout_is_terminal();
bool stderr_is_terminal();

// Value of an environment variable, or nullopt when it is unset.
std::optional<std::string> get_env(const std::string& name);

} // namespace platform
