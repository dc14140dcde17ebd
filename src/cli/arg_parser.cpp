#include "arg_parser.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <functional>
#include <map>

namespace {

using Setter = std::function<Result<void>(ParsedArgs&, const std::string&)>;

Setter string_opt(std::optional<std::string> OptionLayer::*field) {
    return [field](ParsedArgs& parsed, const std::string& value) {
        parsed.options.*field = value;
        return Result<void>::Ok();
    };
}

Setter int_opt(std::optional<int> OptionLayer::*field, const std::string& flag) {
    return [field, flag](ParsedArgs& parsed, const std::string& value) {
        auto number = parse_int(value);
        if (!number) {
            return Result<void>::Err(fmt::format("{}: invalid integer value '{}'", flag, value));
        }
        parsed.options.*field = *number;
        return Result<void>::Ok();
    };
}

// Flags that take a value
const std::map<std::string, Setter>& value_flags() {
    static const std::map<std::string, Setter> flags{
        {"--host",            string_opt(&OptionLayer::host)},
        {"--port",            int_opt(&OptionLayer::port, "--port")},
        {"--user",            string_opt(&OptionLayer::user)},
        {"--password",        string_opt(&OptionLayer::password)},
        {"--password-env",    string_opt(&OptionLayer::password_env)},
        {"--key",             string_opt(&OptionLayer::key)},
        {"--nbot-dir",        string_opt(&OptionLayer::nbot_dir)},
        {"--remote-path",     string_opt(&OptionLayer::remote_path)},
        {"--connect-timeout", int_opt(&OptionLayer::connect_timeout, "--connect-timeout")},
        {"--command-timeout", int_opt(&OptionLayer::command_timeout, "--command-timeout")},
        {"--known-hosts",     string_opt(&OptionLayer::known_hosts)},
        {"--config", [](ParsedArgs& parsed, const std::string& value) {
            parsed.config_path = value;
            return Result<void>::Ok();
        }},
    };
    return flags;
}

} // namespace

Result<ParsedArgs> parse_args(const std::vector<std::string>& args) {
    ParsedArgs parsed;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--version") {
            parsed.show_version = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            parsed.verbose = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        auto it = value_flags().find(name);
        if (it == value_flags().end()) {
            return Result<ParsedArgs>::Err("Unknown argument: " + arg);
        }
        if (!value) {
            if (i + 1 >= args.size()) {
                return Result<ParsedArgs>::Err(name + " expects a value");
            }
            value = args[++i];
        }

        auto set = it->second(parsed, *value);
        if (set.is_err()) {
            return Result<ParsedArgs>::Err(set.error);
        }
    }

    return Result<ParsedArgs>::Ok(parsed);
}

std::string usage_text() {
    std::string out;
    out += theme::section("Usage");
    out += theme::color::BLUE + fmt::format("    {} --host <host> [options]", PROGRAM_NAME)
         + theme::color::RESET + "\n";
    out += theme::color::DIM
         + "    SSH into a server and run nBot docker diagnostics (non-interactive).\n"
         + theme::color::RESET;

    out += theme::section("Connection");
    out += theme::option("--host <host>", "SSH host/IP (required)");
    out += theme::option("--port <n>", fmt::format("SSH port (default: {})", DEFAULT_SSH_PORT));
    out += theme::option("--user <name>", fmt::format("SSH username (default: {})", DEFAULT_SSH_USER));
    out += theme::option("--connect-timeout <s>",
                         fmt::format("Connect/auth timeout (default: {})", DEFAULT_CONNECT_TIMEOUT_SECS));
    out += theme::option("--command-timeout <s>",
                         fmt::format("Remote command timeout (default: {})", DEFAULT_COMMAND_TIMEOUT_SECS));

    out += theme::section("Auth");
    out += theme::option("--key <path>", "SSH private key path (recommended)");
    out += theme::option("--password-env <var>",
                         fmt::format("Env var holding the password (default: {})", DEFAULT_PASSWORD_ENV));
    out += theme::option("--password <pw>", "SSH password (NOT recommended; prefer env var or key)");
    out += theme::option("--known-hosts <path>",
                         "Verify the host key against this file (default: accept any key)");

    out += theme::section("Remote");
    out += theme::option("--nbot-dir <dir>",
                         fmt::format("nBot install dir on remote host (default: {})", DEFAULT_NBOT_DIR));
    out += theme::option("--remote-path <path>",
                         fmt::format("Upload path for the script (default: {})", DEFAULT_REMOTE_PATH));

    out += theme::section("General");
    out += theme::option("--config <file>", "YAML file with defaults for the flags above");
    out += theme::option("-v, --verbose", "Print progress to stderr");
    out += theme::option("--version", "Show version");
    out += theme::option("-h, --help", "Show this help");

    out += "\n" + theme::color::DIM
         + "    Without --known-hosts any host key is accepted. Do not use that mode\n"
         + "    where a man-in-the-middle is a concern.\n"
         + theme::color::RESET + "\n";
    return out;
}
