#include "diagnose_cli.hpp"
#include "arg_parser.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

DiagnoseCLI::DiagnoseCLI(SessionConnector& connector, CLIContext context,
                         std::ostream& out, std::ostream& err)
    : connector_(connector), context_(std::move(context)), out_(out), err_(err) {
}

// Own output (usage, version); remote stdout bypasses this
void DiagnoseCLI::print(const std::string& styled) {
    out_ << (context_.color_out ? styled : theme::plain(styled));
}

// Own diagnostics; remote stderr bypasses this
void DiagnoseCLI::notify(const std::string& styled) {
    err_ << (context_.color_err ? styled : theme::plain(styled));
}

void DiagnoseCLI::print_version() {
    print(theme::color::BROWN + theme::color::BOLD + PROGRAM_NAME
          + theme::color::RESET + theme::color::DIM
          + " version " + PROGRAM_VERSION + theme::color::RESET + "\n");
}

int DiagnoseCLI::report(RunError error, const std::string& message, const RunOptions* options) {
    switch (error) {
    case RunError::Connect:
        notify(theme::fail("SSH connect failed: " + message));
        break;
    case RunError::RemoteExec:
        notify(theme::fail("Remote exec failed: " + message));
        break;
    case RunError::Dependency:
        notify(theme::fail("Missing dependency: libssh2 (" + message + ")"));
        notify(theme::step("Install: apt install libssh2-1  |  dnf install libssh2  |  brew install libssh2"));
        break;
    case RunError::Config:
        notify(theme::fail(message));
        if (options) {
            notify(theme::step(fmt::format(
                "Provide --key /path/to/id_rsa OR set {}=... OR pass --password ...",
                options->password_env)));
        }
        break;
    case RunError::Usage:
        notify(theme::fail(message));
        notify(theme::step(fmt::format("Run '{} --help' for usage.", PROGRAM_NAME)));
        break;
    case RunError::Payload:
    case RunError::None:
        notify(theme::fail(message));
        break;
    }
    return exit_code_for(error);
}

int DiagnoseCLI::run(const std::vector<std::string>& args) {
    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        return report(RunError::Usage, parsed.error);
    }
    if (parsed.value.show_help) {
        print(usage_text());
        return 0;
    }
    if (parsed.value.show_version) {
        print_version();
        return 0;
    }

    OptionLayer file_layer;
    if (parsed.value.config_path) {
        auto loaded = load_config_file(*parsed.value.config_path);
        if (loaded.is_err()) {
            return report(RunError::Config, loaded.error);
        }
        file_layer = loaded.value;
    }

    RunOptions options = merge_options(parsed.value.options, file_layer);
    auto valid = validate_options(options);
    if (valid.is_err()) {
        return report(RunError::Usage, valid.error);
    }

    if (context_.ssh_library.is_err()) {
        return report(RunError::Dependency, context_.ssh_library.error);
    }

    StatusCallback callback;
    if (parsed.value.verbose) {
        callback = [this](const std::string& msg) { notify(theme::log(msg)); };
    }

    DiagnosticRunner runner(connector_, context_.env);
    auto outcome = runner.run(options, context_.payload_path, callback);
    if (!outcome.ok()) {
        return report(outcome.error, outcome.message, &options);
    }

    if (!outcome.stdout_text.empty()) {
        out_ << outcome.stdout_text;
        out_.flush();
    }
    if (!outcome.stderr_text.empty()) {
        err_ << outcome.stderr_text;
        err_.flush();
    }
    return outcome.exit_code;
}
