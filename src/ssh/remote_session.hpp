#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

// An authenticated connection able to place one file and run commands.
// Implementations must make close() idempotent.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Write content to remote_path over SFTP, replacing any existing file.
    virtual Result<void> upload(const std::string& remote_path,
                                const std::string& content) = 0;

    // Run command on a fresh exec channel. Stdin receives EOF immediately.
    // Fails (rather than blocking) once timeout_secs elapses.
    virtual Result<SSHResult> exec(const std::string& command, int timeout_secs) = 0;

    virtual void close() = 0;
};

// Opens sessions. The runner only ever asks for one per run.
class SessionConnector {
public:
    virtual ~SessionConnector() = default;

    virtual Result<std::unique_ptr<RemoteSession>> connect(const ConnectionParams& params,
                                                           StatusCallback callback) = 0;
};

// Scoped owner: the session is closed exactly once, when this goes out of
// scope, whichever way the run ends.
class ScopedSession {
public:
    explicit ScopedSession(std::unique_ptr<RemoteSession> session)
        : session_(std::move(session)) {}

    ~ScopedSession() {
        if (session_) session_->close();
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    RemoteSession* operator->() { return session_.get(); }
    RemoteSession& get() { return *session_; }

private:
    std::unique_ptr<RemoteSession> session_;
};
