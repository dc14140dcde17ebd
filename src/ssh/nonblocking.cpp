#include "nonblocking.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <string>

bool wait_socket(LIBSSH2_SESSION* session, socket_t sock, Deadline deadline) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;

    short events = 0;
    int dir = libssh2_session_block_directions(session);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    // libssh2 has not said what it waits on; poll briefly for input
    if (events == 0) events = POLLIN;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    int slice = static_cast<int>(std::min<long long>(remaining, SOCKET_WAIT_SLICE_MS));
    platform::poll_socket(sock, events, slice);
    return true;
}

std::string last_session_error(LIBSSH2_SESSION* session) {
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len == 0) return "libssh2 error " + std::to_string(code);
    return std::string(msg, static_cast<size_t>(len));
}
