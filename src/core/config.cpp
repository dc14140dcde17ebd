#include "config.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <set>

static const std::set<std::string> KNOWN_KEYS{
    "host", "port", "user", "key", "password_env", "nbot_dir",
    "remote_path", "connect_timeout", "command_timeout", "known_hosts",
};

static std::optional<std::string> read_string(const YAML::Node& root, const char* key) {
    if (!root[key]) return std::nullopt;
    return root[key].as<std::string>();
}

static std::optional<int> read_int(const YAML::Node& root, const char* key) {
    if (!root[key]) return std::nullopt;
    return root[key].as<int>();
}

Result<OptionLayer> load_config_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<OptionLayer>::Err("Config file not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<OptionLayer>::Ok(OptionLayer{});
        }
        if (!root.IsMap()) {
            return Result<OptionLayer>::Err("Config file must be a YAML mapping: " + path.string());
        }

        for (const auto& kv : root) {
            auto key = kv.first.as<std::string>();
            if (key == "password") {
                return Result<OptionLayer>::Err(
                    "Refusing to read a password from " + path.string() + "; use password_env instead");
            }
            if (!KNOWN_KEYS.count(key)) {
                return Result<OptionLayer>::Err(
                    fmt::format("Unknown key '{}' in {}", key, path.string()));
            }
        }

        OptionLayer layer;
        layer.host = read_string(root, "host");
        layer.port = read_int(root, "port");
        layer.user = read_string(root, "user");
        layer.password_env = read_string(root, "password_env");
        layer.key = read_string(root, "key");
        layer.nbot_dir = read_string(root, "nbot_dir");
        layer.remote_path = read_string(root, "remote_path");
        layer.connect_timeout = read_int(root, "connect_timeout");
        layer.command_timeout = read_int(root, "command_timeout");
        layer.known_hosts = read_string(root, "known_hosts");

        if (layer.key) layer.key = expand_home(*layer.key);
        if (layer.known_hosts) layer.known_hosts = expand_home(*layer.known_hosts);

        return Result<OptionLayer>::Ok(layer);
    } catch (const YAML::Exception& e) {
        return Result<OptionLayer>::Err(
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

template <typename T>
static void overlay(T& target, const std::optional<T>& file_value, const std::optional<T>& cli_value) {
    if (cli_value) target = *cli_value;
    else if (file_value) target = *file_value;
}

RunOptions merge_options(const OptionLayer& cli, const OptionLayer& file) {
    RunOptions opts;
    overlay(opts.host, file.host, cli.host);
    overlay(opts.port, file.port, cli.port);
    overlay(opts.user, file.user, cli.user);
    overlay(opts.password_env, file.password_env, cli.password_env);
    overlay(opts.nbot_dir, file.nbot_dir, cli.nbot_dir);
    overlay(opts.remote_path, file.remote_path, cli.remote_path);
    overlay(opts.connect_timeout, file.connect_timeout, cli.connect_timeout);
    overlay(opts.command_timeout, file.command_timeout, cli.command_timeout);

    opts.password = cli.password;
    opts.key = cli.key ? cli.key : file.key;
    opts.known_hosts = cli.known_hosts ? cli.known_hosts : file.known_hosts;
    return opts;
}

Result<void> validate_options(const RunOptions& options) {
    if (options.host.empty()) {
        return Result<void>::Err("--host is required");
    }
    if (options.port < 1 || options.port > 65535) {
        return Result<void>::Err(fmt::format("Invalid port {} (expected 1-65535)", options.port));
    }
    if (options.connect_timeout <= 0 || options.connect_timeout > MAX_TIMEOUT_SECS) {
        return Result<void>::Err(fmt::format(
            "--connect-timeout must be between 1 and {} seconds", MAX_TIMEOUT_SECS));
    }
    if (options.command_timeout <= 0 || options.command_timeout > MAX_TIMEOUT_SECS) {
        return Result<void>::Err(fmt::format(
            "--command-timeout must be between 1 and {} seconds", MAX_TIMEOUT_SECS));
    }
    if (options.remote_path.empty()) {
        return Result<void>::Err("--remote-path must not be empty");
    }
    return Result<void>::Ok();
}

Result<Credential> resolve_credential(const RunOptions& options, const EnvLookup& env) {
    Credential cred;

    // An explicit --password, even an empty one, short-circuits the env lookup
    if (options.password) {
        cred.password = options.password;
    } else if (env) {
        cred.password = env(options.password_env);
    }
    if (cred.password && cred.password->empty()) {
        cred.password.reset();
    }

    if (options.key && !options.key->empty()) {
        cred.key_path = options.key;
    }

    if (!cred.password && !cred.key_path) {
        return Result<Credential>::Err("No auth provided.");
    }
    return Result<Credential>::Ok(cred);
}

Result<ConnectionParams> resolve_connection(const RunOptions& options, const EnvLookup& env) {
    auto cred = resolve_credential(options, env);
    if (cred.is_err()) {
        return Result<ConnectionParams>::Err(cred.error);
    }

    ConnectionParams params;
    params.host = options.host;
    params.port = options.port;
    params.user = options.user;
    params.credential = cred.value;
    params.connect_timeout = options.connect_timeout;
    params.command_timeout = options.command_timeout;
    params.known_hosts_path = options.known_hosts;
    return Result<ConnectionParams>::Ok(params);
}
