#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <managers/diagnostic_runner.hpp>
#include <ssh/remote_session.hpp>

// Everything the front end takes from the process it runs in
struct CLIContext {
    std::filesystem::path payload_path;
    Result<void> ssh_library = Result<void>::Ok();
    EnvLookup env;
    // ANSI styling per stream; off unless the stream is a terminal
    bool color_out = false;
    bool color_err = false;
};

// Command-line front end: parses flags, drives DiagnosticRunner, relays the
// remote streams and turns failures into messages and exit codes.
// Only remote stdout ever reaches `out`.
class DiagnoseCLI {
public:
    DiagnoseCLI(SessionConnector& connector, CLIContext context,
                std::ostream& out, std::ostream& err);

    // Returns the process exit code.
    int run(const std::vector<std::string>& args);

private:
    SessionConnector& connector_;
    CLIContext context_;
    std::ostream& out_;
    std::ostream& err_;

    void print(const std::string& styled);
    void notify(const std::string& styled);
    int report(RunError error, const std::string& message, const RunOptions* options = nullptr);
    void print_version();
};
