#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#  include <cstdio>
#else
#  include <unistd.h>
#  ifdef __APPLE__
#    include <cstdint>
#    include <mach-o/dyld.h>
#  endif
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return fs::temp_directory_path();
    return fs::path(home);
}

fs::path executable_path(const char* argv0) {
    std::error_code ec;
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (n > 0 && n < MAX_PATH) return fs::path(buf);
#elif defined(__APPLE__)
    char buf[4096];
    uint32_t size = sizeof(buf);
    if (_NSGetExecutablePath(buf, &size) == 0) {
        auto resolved = fs::canonical(buf, ec);
        if (!ec) return resolved;
    }
#else
    auto resolved = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return resolved;
#endif
    return executable_from_argv0(argv0);
}

fs::path executable_from_argv0(const char* argv0) {
    std::error_code ec;
    // Without argv0, assume the binary sits in the working directory
    if (!argv0 || !*argv0) return fs::current_path(ec) / PROGRAM_NAME;
    auto absolute = fs::absolute(argv0, ec);
    return ec ? fs::path(argv0) : absolute;
}

bool stdout_is_terminal() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(STDOUT_FILENO) != 0;
#endif
}

bool stderr_is_terminal() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

} // namespace platform
