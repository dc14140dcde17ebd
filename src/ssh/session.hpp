#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "host_key.hpp"
#include "remote_session.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One libssh2 session over one TCP socket. The session runs in non-blocking
// mode; every phase is bounded by a deadline instead of blocking forever.
class SessionManager : public RemoteSession {
public:
    SessionManager(const ConnectionParams& params, std::unique_ptr<HostKeyVerifier> verifier);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // TCP connect, handshake, host key check and authentication, all
    // within params.connect_timeout.
    Result<void> establish(StatusCallback callback = nullptr);

    Result<void> upload(const std::string& remote_path, const std::string& content) override;
    Result<SSHResult> exec(const std::string& command, int timeout_secs) override;
    void close() override;

private:
    ConnectionParams params_;
    std::unique_ptr<HostKeyVerifier> verifier_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    bool handshake_done_;
    std::string target_str_;
    StatusCallback callback_;

    Result<void> establish_connection();
    Result<void> ssh_userauth(std::chrono::steady_clock::time_point deadline);
    void status(const std::string& msg) const;
};

// Opens SessionManager instances against real hosts.
class SSHConnector : public SessionConnector {
public:
    Result<std::unique_ptr<RemoteSession>> connect(const ConnectionParams& params,
                                                   StatusCallback callback) override;
};
