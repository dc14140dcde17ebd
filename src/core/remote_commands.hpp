#pragma once

#include <string>

// chmod +x '<remote_path>'
std::string build_chmod_command(const std::string& remote_path);

// NBOT_DIR='<nbot_dir>' bash '<remote_path>'
// The override is scoped to this one command.
std::string build_run_command(const std::string& remote_path, const std::string& nbot_dir);
