#include "session.hpp"
#include "nonblocking.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <fmt/format.h>

namespace {

// Frees the exec channel on every exit path
class ChannelGuard {
public:
    ChannelGuard(LIBSSH2_SESSION* session, socket_t sock, LIBSSH2_CHANNEL* channel)
        : session_(session), sock_(sock), channel_(channel) {}

    ~ChannelGuard() {
        auto deadline = deadline_after(TEARDOWN_TIMEOUT_SECS);
        retry_eagain(session_, sock_, deadline, [&] { return libssh2_channel_free(channel_); });
    }

    ChannelGuard(const ChannelGuard&) = delete;
    ChannelGuard& operator=(const ChannelGuard&) = delete;

private:
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    LIBSSH2_CHANNEL* channel_;
};

// Read whatever is buffered on one stream. Returns bytes read, 0 at EOF,
// LIBSSH2_ERROR_EAGAIN when nothing is pending, or another negative error.
ssize_t drain_stream(LIBSSH2_CHANNEL* channel, int stream_id, std::string& out) {
    char buf[SSH_READ_BUF_SIZE];
    ssize_t total = 0;
    for (;;) {
        ssize_t n = libssh2_channel_read_ex(channel, stream_id, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            total += n;
            continue;
        }
        if (total > 0 && (n == 0 || n == LIBSSH2_ERROR_EAGAIN)) return total;
        return n;
    }
}

} // namespace

Result<SSHResult> SessionManager::exec(const std::string& command, int timeout_secs) {
    if (!active_) {
        return Result<SSHResult>::Err("No active session");
    }

    auto deadline = deadline_after(timeout_secs);
    auto timed_out_after = [&](const std::string& what) {
        return Result<SSHResult>::Err(fmt::format("{} timed out after {}s", what, timeout_secs));
    };

    bool timed_out = false;
    LIBSSH2_CHANNEL* channel = retry_open(session_, sock_, deadline, [&] {
        return libssh2_channel_open_session(session_);
    }, timed_out);
    if (!channel) {
        if (timed_out) return timed_out_after("Opening exec channel");
        return Result<SSHResult>::Err("Failed to open exec channel: " + last_session_error(session_));
    }
    ChannelGuard guard(session_, sock_, channel);

    status("Running: " + command);
    int rc = retry_eagain(session_, sock_, deadline, [&] {
        return libssh2_channel_exec(channel, command.c_str());
    });
    if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out_after("Starting remote command");
    if (rc != 0) {
        return Result<SSHResult>::Err("Failed to start remote command: " + last_session_error(session_));
    }

    // Nothing is ever written to the remote stdin
    rc = retry_eagain(session_, sock_, deadline, [&] { return libssh2_channel_send_eof(channel); });
    if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out_after("Remote command");
    if (rc != 0) {
        return Result<SSHResult>::Err("Failed to close remote stdin: " + last_session_error(session_));
    }

    SSHResult result{0, "", ""};
    bool out_done = false;
    bool err_done = false;
    while (!out_done || !err_done) {
        bool progressed = false;

        if (!out_done) {
            ssize_t n = drain_stream(channel, 0, result.stdout_data);
            if (n > 0) progressed = true;
            else if (n == 0) out_done = true;
            else if (n != LIBSSH2_ERROR_EAGAIN) {
                return Result<SSHResult>::Err("Reading stdout failed: " + last_session_error(session_));
            }
        }
        if (!err_done) {
            ssize_t n = drain_stream(channel, SSH_EXTENDED_DATA_STDERR, result.stderr_data);
            if (n > 0) progressed = true;
            else if (n == 0) err_done = true;
            else if (n != LIBSSH2_ERROR_EAGAIN) {
                return Result<SSHResult>::Err("Reading stderr failed: " + last_session_error(session_));
            }
        }

        // Both streams end together once the server sends EOF
        if (libssh2_channel_eof(channel) && !progressed) break;

        if (!progressed && !wait_socket(session_, sock_, deadline)) {
            return timed_out_after("Remote command");
        }
    }

    rc = retry_eagain(session_, sock_, deadline, [&] { return libssh2_channel_close(channel); });
    if (rc == 0) {
        rc = retry_eagain(session_, sock_, deadline, [&] { return libssh2_channel_wait_closed(channel); });
    }
    if (rc == LIBSSH2_ERROR_TIMEOUT) return timed_out_after("Remote command");
    if (rc != 0) {
        return Result<SSHResult>::Err("Failed to close exec channel: " + last_session_error(session_));
    }

    char* signal_name = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel, &signal_name, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal_name) {
        std::string sig(signal_name, signal_len);
        libssh2_free(session_, signal_name);
        return Result<SSHResult>::Err("Remote command terminated by signal " + sig);
    }

    result.exit_code = libssh2_channel_get_exit_status(channel);
    status(fmt::format("Remote command exited with status {}", result.exit_code));
    return Result<SSHResult>::Ok(std::move(result));
}
