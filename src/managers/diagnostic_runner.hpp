#pragma once

#include <string>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/remote_session.hpp>

// What stopped a run. Each kind maps to one process exit code.
enum class RunError {
    None,
    Usage,        // bad flags or values
    Config,       // no credential, unreadable config file
    Payload,      // local script missing
    Dependency,   // SSH library unusable
    Connect,      // TCP, handshake, host key or auth
    RemoteExec,   // upload, chmod, exec or stream read
};

int exit_code_for(RunError error);

struct RunOutcome {
    RunError error = RunError::None;
    std::string message;          // cause, empty on success
    std::string stdout_text;      // decoded remote stdout
    std::string stderr_text;      // decoded remote stderr
    int exit_code = 0;            // remote status on success, else exit_code_for(error)

    bool ok() const { return error == RunError::None; }

    static RunOutcome failure(RunError error, const std::string& message);
};

// Headless pipeline: resolve credential, load payload, connect, upload,
// chmod, execute, decode. Printing is left to the caller.
class DiagnosticRunner {
public:
    DiagnosticRunner(SessionConnector& connector, EnvLookup env);

    RunOutcome run(const RunOptions& options,
                   const std::filesystem::path& payload_path,
                   StatusCallback callback = nullptr);

private:
    SessionConnector& connector_;
    EnvLookup env_;

    RunOutcome run_remote(RemoteSession& session, const RunOptions& options,
                          const std::string& payload, StatusCallback callback);
};
