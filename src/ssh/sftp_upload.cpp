#include "session.hpp"
#include "nonblocking.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <algorithm>

// Upload is bounded by the command timeout; the same deadline covers opening
// the subsystem, writing every chunk and closing the handle.
Result<void> SessionManager::upload(const std::string& remote_path, const std::string& content) {
    if (!active_) {
        return Result<void>::Err("No active session");
    }

    auto deadline = deadline_after(params_.command_timeout);
    auto timeout_error = [&](const std::string& what) {
        return Result<void>::Err(fmt::format("{} timed out after {}s", what, params_.command_timeout));
    };

    status("Opening SFTP channel...");
    bool timed_out = false;
    LIBSSH2_SFTP* sftp = retry_open(session_, sock_, deadline, [&] {
        return libssh2_sftp_init(session_);
    }, timed_out);
    if (!sftp) {
        if (timed_out) return timeout_error("Opening SFTP channel");
        return Result<void>::Err("Failed to open SFTP channel: " + last_session_error(session_));
    }

    auto shutdown_sftp = [&] {
        auto teardown = deadline_after(TEARDOWN_TIMEOUT_SECS);
        retry_eagain(session_, sock_, teardown, [&] { return libssh2_sftp_shutdown(sftp); });
    };

    LIBSSH2_SFTP_HANDLE* handle = retry_open(session_, sock_, deadline, [&] {
        return libssh2_sftp_open_ex(sftp, remote_path.c_str(),
                                    static_cast<unsigned int>(remote_path.length()),
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                    REMOTE_UPLOAD_MODE, LIBSSH2_SFTP_OPENFILE);
    }, timed_out);
    if (!handle) {
        std::string err = timed_out
            ? fmt::format("Opening {} timed out after {}s", remote_path, params_.command_timeout)
            : fmt::format("Cannot open {} for writing (sftp status {})",
                          remote_path, libssh2_sftp_last_error(sftp));
        shutdown_sftp();
        return Result<void>::Err(err);
    }

    status(fmt::format("Writing {} bytes to {}...", content.size(), remote_path));

    std::string write_error;
    size_t written = 0;
    while (written < content.size()) {
        size_t chunk = std::min(content.size() - written, static_cast<size_t>(SFTP_WRITE_CHUNK));
        ssize_t n = retry_eagain(session_, sock_, deadline, [&] {
            return libssh2_sftp_write(handle, content.data() + written, chunk);
        });
        if (n == LIBSSH2_ERROR_TIMEOUT) {
            write_error = fmt::format("Writing {} timed out after {}s", remote_path, params_.command_timeout);
            break;
        }
        if (n < 0) {
            write_error = fmt::format("Write to {} failed: {}", remote_path, last_session_error(session_));
            break;
        }
        written += static_cast<size_t>(n);
    }

    int rc = retry_eagain(session_, sock_, deadline, [&] {
        return libssh2_sftp_close_handle(handle);
    });
    if (write_error.empty() && rc != 0) {
        write_error = fmt::format("Closing {} failed: {}", remote_path, last_session_error(session_));
    }

    shutdown_sftp();

    if (!write_error.empty()) {
        return Result<void>::Err(write_error);
    }
    return Result<void>::Ok();
}
