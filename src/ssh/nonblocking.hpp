#pragma once

// Helpers for driving a non-blocking libssh2 session against a deadline.

#include <chrono>
#include <string>
#include <libssh2.h>
#include <platform/socket_util.hpp>

using Deadline = std::chrono::steady_clock::time_point;

inline Deadline deadline_after(int seconds) {
    return std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
}

// Block until the socket is ready in whichever direction libssh2 is waiting
// on. Returns false once the deadline has passed.
bool wait_socket(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline);

// Repeat a libssh2 call while it reports EAGAIN. Returns its final return
// code, or LIBSSH2_ERROR_TIMEOUT if the deadline passes first.
template <typename Fn>
auto retry_eagain(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline, Fn&& fn)
    -> decltype(fn()) {
    decltype(fn()) rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket(session, sock, deadline)) {
            return LIBSSH2_ERROR_TIMEOUT;
        }
    }
    return rc;
}

// Same for calls that return a handle and signal EAGAIN through
// libssh2_session_last_errno(). Returns nullptr on failure or timeout;
// timed_out tells the two apart.
template <typename Fn>
auto retry_open(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline, Fn&& fn,
                bool& timed_out) -> decltype(fn()) {
    timed_out = false;
    decltype(fn()) handle;
    while ((handle = fn()) == nullptr) {
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) {
            return nullptr;
        }
        if (!wait_socket(session, sock, deadline)) {
            timed_out = true;
            return nullptr;
        }
    }
    return handle;
}

// Human-readable text of the session's last error.
std::string last_session_error(LIBSSH2_SESSION* session);
