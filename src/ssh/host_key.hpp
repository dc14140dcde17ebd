#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declaration
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Decides whether the server's host key is trusted. Runs after the
// handshake and before any credential is sent.
class HostKeyVerifier {
public:
    virtual ~HostKeyVerifier() = default;

    virtual Result<void> verify(LIBSSH2_SESSION* session,
                                const std::string& host, int port) = 0;

    virtual std::string describe() const = 0;
};

// Accepts any host key, including unknown ones. Suits unattended runs;
// offers no protection against a man-in-the-middle.
class AcceptAllHostKeys : public HostKeyVerifier {
public:
    Result<void> verify(LIBSSH2_SESSION* session,
                        const std::string& host, int port) override;
    std::string describe() const override { return "accept-all"; }
};

// Requires the key to be pinned in an OpenSSH known_hosts file. Unknown
// hosts and mismatching keys are both rejected; the file is never modified.
class KnownHostsVerifier : public HostKeyVerifier {
public:
    explicit KnownHostsVerifier(std::string known_hosts_path);

    Result<void> verify(LIBSSH2_SESSION* session,
                        const std::string& host, int port) override;
    std::string describe() const override { return "known-hosts " + path_; }

private:
    std::string path_;
};

// Accept-all unless a known_hosts file was configured.
std::unique_ptr<HostKeyVerifier> make_host_key_verifier(
    const std::optional<std::string>& known_hosts_path);
