#include <gtest/gtest.h>
#include <platform/socket_util.hpp>
#include <ssh/host_key.hpp>
#include <ssh/library.hpp>
#include <ssh/session.hpp>
#include <chrono>
#include <string>
#include <vector>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using Clock = std::chrono::steady_clock;

// Loopback listener that completes the TCP handshake (via the backlog) but
// never speaks SSH.
class SilentListenerTest : public ::testing::Test {
protected:
    SSHLibrary library_;
    int listener_ = -1;
    int port_ = 0;

    void SetUp() override {
        ASSERT_TRUE(library_.status().is_ok()) << library_.status().error;

        listener_ = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(listener_, 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ASSERT_EQ(bind(listener_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
        ASSERT_EQ(listen(listener_, 4), 0);

        socklen_t len = sizeof(addr);
        ASSERT_EQ(getsockname(listener_, reinterpret_cast<sockaddr*>(&addr), &len), 0);
        port_ = ntohs(addr.sin_port);
    }

    void TearDown() override {
        if (listener_ >= 0) ::close(listener_);
    }

    // Port that was bound a moment ago and is now closed
    static int closed_port() {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
        ::close(fd);
        return ntohs(addr.sin_port);
    }

    ConnectionParams params(int connect_timeout) const {
        ConnectionParams p;
        p.host = "127.0.0.1";
        p.port = port_;
        p.user = "nobody";
        p.credential.password = "pw";
        p.connect_timeout = connect_timeout;
        return p;
    }

    // Accept the queued client connection and report whether the peer has
    // closed it (EOF) within timeout_ms.
    bool peer_closed_within(int timeout_ms) {
        if (platform::poll_socket(listener_, POLLIN, timeout_ms) == 0) return false;
        int conn = accept(listener_, nullptr, nullptr);
        if (conn < 0) return false;

        auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        bool closed = false;
        char buf[256];
        while (Clock::now() < deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now()).count();
            if (platform::poll_socket(conn, POLLIN, static_cast<int>(left)) == 0) break;
            ssize_t n = recv(conn, buf, sizeof(buf), 0);
            if (n <= 0) {
                closed = true;
                break;
            }
        }
        ::close(conn);
        return closed;
    }
};

TEST_F(SilentListenerTest, ConnectTcpToClosedPortFailsFast) {
    int port = closed_port();
    auto start = Clock::now();
    auto result = platform::connect_tcp("127.0.0.1", port, std::chrono::seconds(5));
    auto elapsed = Clock::now() - start;

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("127.0.0.1"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(SilentListenerTest, ConnectTcpReachesListener) {
    auto result = platform::connect_tcp("127.0.0.1", port_, std::chrono::seconds(2));
    ASSERT_TRUE(result.is_ok()) << result.error;
    platform::close_socket(result.value);
}

TEST_F(SilentListenerTest, ConnectTcpAcceptsLongTimeouts) {
    // Thirty days in milliseconds exceeds INT_MAX
    auto result = platform::connect_tcp("127.0.0.1", port_, std::chrono::hours(24 * 30));
    ASSERT_TRUE(result.is_ok()) << result.error;
    platform::close_socket(result.value);
}

TEST_F(SilentListenerTest, MissingBannerTimesOutWithinConnectTimeout) {
    SSHConnector connector;

    auto start = Clock::now();
    auto result = connector.connect(params(1), nullptr);
    auto elapsed = Clock::now() - start;

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("timed out"), std::string::npos) << result.error;
    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::milliseconds(2500));

    // The failed session must have released its socket
    EXPECT_TRUE(peer_closed_within(2000));
}

TEST_F(SilentListenerTest, StatusCallbackSeesProgressBeforeTimeout) {
    SSHConnector connector;
    std::vector<std::string> messages;

    auto result = connector.connect(params(1), [&](const std::string& msg) {
        messages.push_back(msg);
    });

    ASSERT_TRUE(result.is_err());
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages.front().find("Connecting to 127.0.0.1"), std::string::npos);
}
#endif

TEST(HostKeyVerifier, DefaultAcceptsAll) {
    auto verifier = make_host_key_verifier(std::nullopt);
    EXPECT_EQ(verifier->describe(), "accept-all");

    auto empty = make_host_key_verifier(std::string());
    EXPECT_EQ(empty->describe(), "accept-all");
}

TEST(HostKeyVerifier, KnownHostsFileSelectsPinnedVerifier) {
    auto verifier = make_host_key_verifier(std::string("/etc/ssh/ssh_known_hosts"));
    EXPECT_EQ(verifier->describe(), "known-hosts /etc/ssh/ssh_known_hosts");
}

TEST(HostKeyVerifier, MissingKnownHostsFileIsReported) {
    KnownHostsVerifier verifier("/nonexistent/nbotdiag/known_hosts");
    // The file check happens before the session is touched
    auto result = verifier.verify(nullptr, "example.org", 22);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("not found"), std::string::npos);
    EXPECT_NE(result.error.find("/nonexistent/nbotdiag/known_hosts"), std::string::npos);
}
