#include "payload.hpp"
#include "constants.hpp"
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

fs::path default_payload_path(const fs::path& executable) {
    return executable.parent_path() / PAYLOAD_FILENAME;
}

Result<std::string> load_payload(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::string>::Err("Missing local script: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::Err("Cannot read local script: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::Err("Error reading local script: " + path.string());
    }
    return Result<std::string>::Ok(content);
}
