#pragma once

// ── Program ─────────────────────────────────────────────────
constexpr const char* PROGRAM_NAME    = "nbot-diagnose";
constexpr const char* PROGRAM_VERSION = "0.1.0";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT               = 22;
constexpr const char* DEFAULT_SSH_USER       = "root";
constexpr const char* DEFAULT_PASSWORD_ENV   = "NBOT_SSH_PASSWORD";
constexpr const char* DEFAULT_NBOT_DIR       = "/opt/nbot";
constexpr const char* DEFAULT_REMOTE_PATH    = "/tmp/nbot-diagnose.sh";
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS   = 15;
constexpr int DEFAULT_COMMAND_TIMEOUT_SECS   = 180;
constexpr int MAX_TIMEOUT_SECS               = 86400;  // Upper bound for both timeouts

// ── Local payload ───────────────────────────────────────────
// Looked up next to the executable.
constexpr const char* PAYLOAD_FILENAME = "diagnose.sh";

// ── Remote invocation ───────────────────────────────────────
// Use fmt::format with these; arguments are already shell-quoted.
constexpr const char* NBOT_DIR_ENV_NAME   = "NBOT_DIR";
constexpr const char* REMOTE_CHMOD_CMD    = "chmod +x {}";
constexpr const char* REMOTE_RUN_CMD      = "{}={} bash {}";     // env name, dir, script
constexpr long REMOTE_UPLOAD_MODE         = 0644;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_REMOTE_FAILURE = 1;   // connect, auth, transfer, exec
constexpr int EXIT_LOCAL_FAILURE  = 2;   // usage, credentials, payload, dependency

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE   = 4096;
constexpr int SFTP_WRITE_CHUNK    = 32768;

// ── Polling ─────────────────────────────────────────────────
constexpr int SOCKET_WAIT_SLICE_MS = 100;   // Max poll() slice while waiting on libssh2
constexpr int TEARDOWN_TIMEOUT_SECS = 5;      // Bound on channel/session shutdown
