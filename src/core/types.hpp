#pragma once

#include <string>
#include <optional>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result (raw bytes, not yet decoded)
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Exactly one auth path is used per run. A key path wins over a password;
// when both are present the password unlocks the key.
struct Credential {
    std::optional<std::string> password;
    std::optional<std::string> key_path;

    bool uses_key() const { return key_path.has_value(); }
};

// Resolved, immutable parameters for the single session of a run
struct ConnectionParams {
    std::string host;
    int port = 22;
    std::string user;
    Credential credential;
    int connect_timeout = 15;
    int command_timeout = 180;
    std::optional<std::string> known_hosts_path;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
