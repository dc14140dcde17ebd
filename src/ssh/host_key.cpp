#include "host_key.hpp"
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>

Result<void> AcceptAllHostKeys::verify(LIBSSH2_SESSION* session,
                                       const std::string& /*host*/, int /*port*/) {
    size_t len = 0;
    int type = 0;
    if (!libssh2_session_hostkey(session, &len, &type)) {
        return Result<void>::Err("Server did not present a host key");
    }
    return Result<void>::Ok();
}

KnownHostsVerifier::KnownHostsVerifier(std::string known_hosts_path)
    : path_(std::move(known_hosts_path)) {
}

// Map the session host key type onto the knownhost key mask
static int knownhost_key_mask(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

Result<void> KnownHostsVerifier::verify(LIBSSH2_SESSION* session,
                                        const std::string& host, int port) {
    if (!std::filesystem::exists(path_)) {
        return Result<void>::Err("Known hosts file not found: " + path_);
    }

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)> hosts(
        libssh2_knownhost_init(session), libssh2_knownhost_free);
    if (!hosts) {
        return Result<void>::Err("Failed to initialize known hosts store");
    }

    if (libssh2_knownhost_readfile(hosts.get(), path_.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        return Result<void>::Err("Failed to parse known hosts file: " + path_);
    }

    size_t len = 0;
    int type = 0;
    const char* key = libssh2_session_hostkey(session, &len, &type);
    if (!key) {
        return Result<void>::Err("Server did not present a host key");
    }

    struct libssh2_knownhost* match = nullptr;
    int check = libssh2_knownhost_checkp(hosts.get(), host.c_str(), port, key, len,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                         LIBSSH2_KNOWNHOST_KEYENC_RAW |
                                         knownhost_key_mask(type),
                                         &match);
    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return Result<void>::Ok();
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        return Result<void>::Err(fmt::format("Host key for {}:{} not found in {}", host, port, path_));
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        return Result<void>::Err(fmt::format(
            "Host key for {}:{} does NOT match {} (possible man-in-the-middle)", host, port, path_));
    default:
        return Result<void>::Err("Host key check failed");
    }
}

std::unique_ptr<HostKeyVerifier> make_host_key_verifier(
    const std::optional<std::string>& known_hosts_path) {
    if (known_hosts_path && !known_hosts_path->empty()) {
        return std::make_unique<KnownHostsVerifier>(*known_hosts_path);
    }
    return std::make_unique<AcceptAllHostKeys>();
}
