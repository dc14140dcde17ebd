#include "diagnostic_runner.hpp"
#include <core/constants.hpp>
#include <core/payload.hpp>
#include <core/remote_commands.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

int exit_code_for(RunError error) {
    switch (error) {
    case RunError::None:
        return 0;
    case RunError::Usage:
    case RunError::Config:
    case RunError::Payload:
    case RunError::Dependency:
        return EXIT_LOCAL_FAILURE;
    case RunError::Connect:
    case RunError::RemoteExec:
        return EXIT_REMOTE_FAILURE;
    }
    return EXIT_REMOTE_FAILURE;
}

RunOutcome RunOutcome::failure(RunError error, const std::string& message) {
    RunOutcome outcome;
    outcome.error = error;
    outcome.message = message;
    outcome.exit_code = exit_code_for(error);
    return outcome;
}

DiagnosticRunner::DiagnosticRunner(SessionConnector& connector, EnvLookup env)
    : connector_(connector), env_(std::move(env)) {
}

RunOutcome DiagnosticRunner::run(const RunOptions& options,
                                 const std::filesystem::path& payload_path,
                                 StatusCallback callback) {
    // Local preconditions first: neither needs the network
    auto params = resolve_connection(options, env_);
    if (params.is_err()) {
        return RunOutcome::failure(RunError::Config, params.error);
    }

    auto payload = load_payload(payload_path);
    if (payload.is_err()) {
        return RunOutcome::failure(RunError::Payload, payload.error);
    }

    auto connected = connector_.connect(params.value, callback);
    if (connected.is_err()) {
        return RunOutcome::failure(RunError::Connect, connected.error);
    }

    ScopedSession session(std::move(connected.value));
    return run_remote(session.get(), options, payload.value, callback);
}

RunOutcome DiagnosticRunner::run_remote(RemoteSession& session, const RunOptions& options,
                                        const std::string& payload, StatusCallback callback) {
    auto uploaded = session.upload(options.remote_path, payload);
    if (uploaded.is_err()) {
        return RunOutcome::failure(RunError::RemoteExec, uploaded.error);
    }
    if (callback) callback(fmt::format("Uploaded {} bytes to {}", payload.size(), options.remote_path));

    auto chmod = session.exec(build_chmod_command(options.remote_path), options.command_timeout);
    if (chmod.is_err()) {
        return RunOutcome::failure(RunError::RemoteExec, chmod.error);
    }
    if (chmod.value.failed()) {
        std::string detail = decode_utf8_lossy(chmod.value.stderr_data);
        trim(detail);
        return RunOutcome::failure(RunError::RemoteExec, fmt::format(
            "chmod +x {} exited with status {}{}", options.remote_path, chmod.value.exit_code,
            detail.empty() ? "" : ": " + detail));
    }

    auto executed = session.exec(build_run_command(options.remote_path, options.nbot_dir),
                                 options.command_timeout);
    if (executed.is_err()) {
        return RunOutcome::failure(RunError::RemoteExec, executed.error);
    }

    RunOutcome outcome;
    outcome.stdout_text = decode_utf8_lossy(executed.value.stdout_data);
    outcome.stderr_text = decode_utf8_lossy(executed.value.stderr_data);
    outcome.exit_code = executed.value.exit_code;
    return outcome;
}
