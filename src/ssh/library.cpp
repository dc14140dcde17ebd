#include "library.hpp"
#include <libssh2.h>
#include <fmt/format.h>

SSHLibrary::SSHLibrary() : status_(Result<void>::Ok()), initialized_(false) {
    // A shared library older than the headers we built against is as good
    // as missing.
    if (!libssh2_version(LIBSSH2_VERSION_NUM)) {
        status_ = Result<void>::Err(fmt::format(
            "libssh2 {} or newer required, found {}", LIBSSH2_VERSION, runtime_version()));
        return;
    }

    int rc = libssh2_init(0);
    if (rc != 0) {
        status_ = Result<void>::Err(fmt::format("Failed to initialize libssh2 (error {})", rc));
        return;
    }
    initialized_ = true;
}

SSHLibrary::~SSHLibrary() {
    if (initialized_) {
        libssh2_exit();
    }
}

std::string SSHLibrary::runtime_version() {
    const char* version = libssh2_version(0);
    return version ? version : "unknown";
}
