#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Path of the diagnostic script shipped next to the executable.
std::filesystem::path default_payload_path(const std::filesystem::path& executable);

// Read the script as raw bytes. Fails with "Missing local script: <path>"
// when the file does not exist.
Result<std::string> load_payload(const std::filesystem::path& path);
