#include "remote_commands.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>

std::string build_chmod_command(const std::string& remote_path) {
    return fmt::format(REMOTE_CHMOD_CMD, shell_quote(remote_path));
}

std::string build_run_command(const std::string& remote_path, const std::string& nbot_dir) {
    return fmt::format(REMOTE_RUN_CMD, NBOT_DIR_ENV_NAME, shell_quote(nbot_dir),
                       shell_quote(remote_path));
}
