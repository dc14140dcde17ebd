#include "socket_util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <limits>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

static bool connect_in_progress() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EINPROGRESS;
#endif
}

Result<socket_t> connect_tcp(const std::string& host, int port,
                             std::chrono::milliseconds timeout) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addrs = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &addrs);
    if (gai != 0) {
        return Result<socket_t>::Err(
            fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto timeout_secs = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    std::string last_error = "no usable address";

    for (auto* ai = addrs; ai != nullptr; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            last_error = fmt::format("timed out after {}s", timeout_secs);
            break;
        }

        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == NBOTDIAG_INVALID_SOCKET) {
            last_error = std::string("failed to create socket: ") + std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = ::connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
        if (ret < 0 && !connect_in_progress()) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int slice = static_cast<int>(std::min<long long>(remaining, std::numeric_limits<int>::max()));
            int revents = poll_socket(sock, POLLOUT, slice);
            if (revents == 0) {
                close_socket(sock);
                last_error = fmt::format("timed out after {}s", timeout_secs);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                close_socket(sock);
                last_error = std::strerror(sock_err);
                continue;
            }
        }

        freeaddrinfo(addrs);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(addrs);
    return Result<socket_t>::Err(
        fmt::format("TCP connection to {}:{} failed: {}", host, port, last_error));
}

} // namespace platform
