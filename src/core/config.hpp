#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// One source of settings (command line or config file). Unset fields fall
// through to the next layer.
struct OptionLayer {
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> password;         // never read from a file
    std::optional<std::string> password_env;
    std::optional<std::string> key;
    std::optional<std::string> nbot_dir;
    std::optional<std::string> remote_path;
    std::optional<int> connect_timeout;
    std::optional<int> command_timeout;
    std::optional<std::string> known_hosts;
};

// Fully defaulted settings for one run
struct RunOptions {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string user = DEFAULT_SSH_USER;
    std::optional<std::string> password;
    std::string password_env = DEFAULT_PASSWORD_ENV;
    std::optional<std::string> key;
    std::string nbot_dir = DEFAULT_NBOT_DIR;
    std::string remote_path = DEFAULT_REMOTE_PATH;
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    int command_timeout = DEFAULT_COMMAND_TIMEOUT_SECS;
    std::optional<std::string> known_hosts;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Load a YAML defaults file. Unknown keys are rejected so typos surface.
Result<OptionLayer> load_config_file(const fs::path& path);

// Command line wins over the config file, which wins over built-in defaults.
RunOptions merge_options(const OptionLayer& cli, const OptionLayer& file = {});

// Range checks: host present, port 1..65535, positive timeouts.
Result<void> validate_options(const RunOptions& options);

// Pick the credential: --password, else $password_env, else nothing; a key
// path is used whenever given. Fails when no usable credential remains.
Result<Credential> resolve_credential(const RunOptions& options, const EnvLookup& env);

Result<ConnectionParams> resolve_connection(const RunOptions& options, const EnvLookup& env);
