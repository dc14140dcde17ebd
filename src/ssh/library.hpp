#pragma once

#include <string>
#include <core/types.hpp>

// Process-wide libssh2 lifetime. Construct once in main(), before any
// session is opened; status() reports whether the library is usable.
class SSHLibrary {
public:
    SSHLibrary();
    ~SSHLibrary();

    SSHLibrary(const SSHLibrary&) = delete;
    SSHLibrary& operator=(const SSHLibrary&) = delete;

    const Result<void>& status() const { return status_; }

    // Version string of the libssh2 actually loaded at runtime
    static std::string runtime_version();

private:
    Result<void> status_;
    bool initialized_;
};
