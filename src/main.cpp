#include <iostream>
#include <string>
#include <vector>
#include "cli/diagnose_cli.hpp"
#include "cli/theme.hpp"
#include "core/payload.hpp"
#include "platform/platform.hpp"
#include "ssh/library.hpp"
#include "ssh/session.hpp"

int main(int argc, char** argv) {
    try {
        SSHLibrary ssh_library;
        SSHConnector connector;

        CLIContext context;
        context.payload_path = default_payload_path(platform::executable_path(argv[0]));
        context.ssh_library = ssh_library.status();
        context.env = platform::get_env;
        context.color_out = platform::stdout_is_terminal();
        context.color_err = platform::stderr_is_terminal();

        std::vector<std::string> args(argv + 1, argv + argc);
        DiagnoseCLI cli(connector, context, std::cout, std::cerr);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
