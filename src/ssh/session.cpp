#include "session.hpp"
#include "nonblocking.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>

SessionManager::SessionManager(const ConnectionParams& params,
                               std::unique_ptr<HostKeyVerifier> verifier)
    : params_(params), verifier_(std::move(verifier)), session_(nullptr),
      sock_(NBOTDIAG_INVALID_SOCKET), active_(false), handshake_done_(false) {
}

SessionManager::~SessionManager() {
    close();
}

void SessionManager::status(const std::string& msg) const {
    if (callback_) callback_(msg);
}

Result<void> SessionManager::establish(StatusCallback callback) {
    callback_ = std::move(callback);
    auto result = establish_connection();
    if (result.is_err()) {
        close();
    }
    return result;
}

Result<void> SessionManager::establish_connection() {
    // One deadline covers TCP connect, banner/key exchange and authentication
    auto deadline = deadline_after(params_.connect_timeout);

    status(fmt::format("Connecting to {}:{}...", params_.host, params_.port));

    auto sock = platform::connect_tcp(params_.host, params_.port,
                                      std::chrono::seconds(params_.connect_timeout));
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;

    status("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    int rc = retry_eagain(session_, sock_, deadline, [&] {
        return libssh2_session_handshake(session_, sock_);
    });
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return Result<void>::Err(fmt::format(
            "SSH handshake timed out after {}s", params_.connect_timeout));
    }
    if (rc != 0) {
        return Result<void>::Err("SSH handshake failed: " + last_session_error(session_));
    }
    handshake_done_ = true;

    auto host_check = verifier_->verify(session_, params_.host, params_.port);
    if (host_check.is_err()) {
        return host_check;
    }
    status("Host key accepted (" + verifier_->describe() + "), authenticating...");

    auto auth = ssh_userauth(deadline);
    if (auth.is_err()) {
        return auth;
    }

    active_ = true;
    target_str_ = params_.user + "@" + params_.host;
    status("Connected to " + target_str_);
    return Result<void>::Ok();
}

Result<void> SessionManager::ssh_userauth(Deadline deadline) {
    const auto& user = params_.user;
    const auto& cred = params_.credential;
    const std::string method = cred.uses_key() ? "publickey" : "password";

    // Asking for the method list doubles as the "none" auth attempt
    bool timed_out = false;
    char* auth_list = retry_open(session_, sock_, deadline, [&] {
        return libssh2_userauth_list(session_, user.c_str(),
                                     static_cast<unsigned int>(user.length()));
    }, timed_out);
    if (timed_out) {
        return Result<void>::Err(fmt::format(
            "Authentication timed out after {}s", params_.connect_timeout));
    }
    if (!auth_list) {
        if (libssh2_userauth_authenticated(session_)) {
            return Result<void>::Ok();
        }
        return Result<void>::Err("Failed to query auth methods: " + last_session_error(session_));
    }

    std::string methods = auth_list;
    status("Auth methods: " + methods);
    if (methods.find(method) == std::string::npos) {
        return Result<void>::Err(fmt::format(
            "Server does not accept {} authentication (offers: {})", method, methods));
    }

    int rc;
    if (cred.uses_key()) {
        status("Using key " + *cred.key_path + "...");
        const std::string passphrase = cred.password.value_or("");
        rc = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_userauth_publickey_fromfile_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                nullptr, cred.key_path->c_str(), passphrase.c_str());
        });
    } else {
        status("Using password auth...");
        const std::string password = cred.password.value_or("");
        rc = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_userauth_password_ex(
                session_, user.c_str(), static_cast<unsigned int>(user.length()),
                password.c_str(), static_cast<unsigned int>(password.length()), nullptr);
        });
    }

    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return Result<void>::Err(fmt::format(
            "Authentication timed out after {}s", params_.connect_timeout));
    }
    if (rc != 0) {
        return Result<void>::Err(fmt::format(
            "Authentication failed for {} ({}): {}", user, method, last_session_error(session_)));
    }

    status("Authentication successful");
    return Result<void>::Ok();
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        auto deadline = deadline_after(TEARDOWN_TIMEOUT_SECS);
        // No disconnect message before key exchange has completed
        if (handshake_done_) {
            retry_eagain(session_, sock_, deadline, [&] {
                return libssh2_session_disconnect(session_, "Normal disconnection");
            });
        }
        retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_session_free(session_);
        });
        session_ = nullptr;
        handshake_done_ = false;
    }

    if (sock_ != NBOTDIAG_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = NBOTDIAG_INVALID_SOCKET;
    }
}

Result<std::unique_ptr<RemoteSession>> SSHConnector::connect(const ConnectionParams& params,
                                                             StatusCallback callback) {
    auto session = std::make_unique<SessionManager>(
        params, make_host_key_verifier(params.known_hosts_path));

    auto result = session->establish(std::move(callback));
    if (result.is_err()) {
        return Result<std::unique_ptr<RemoteSession>>::Err(result.error);
    }
    return Result<std::unique_ptr<RemoteSession>>::Ok(std::move(session));
}
