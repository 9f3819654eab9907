// wkmux – browser server multiplexer
// Entry point: launches the browser on a protocol pipe and shares it between
// WebSocket clients until the browser exits.
//
// The endpoint is printed on stdout. Logs go to stderr.

#include <iostream>
#include <string>
#include <vector>
#include <csignal>

#include "server/browser_server.hpp"
#include "server/launch_options.hpp"
#include "utils/debug_log.hpp"

int main(int argc, char **argv) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    launch_options::CommandLineResult command_line = launch_options::parse_command_line(arguments);
    if (!command_line.success) {
        std::cerr << "[wkmux] " << command_line.error_message << std::endl;
        std::cerr << launch_options::usage();
        return 2;
    }
    if (command_line.show_help) {
        std::cout << launch_options::usage();
        return 0;
    }

    // Write failures on the pipe are reported by the transport, not by SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[wkmux] wkmux – browser server multiplexer, build " << __DATE__ << " " << __TIME__ << std::endl;

    browser_server::BrowserServer server(command_line.options);
    server.set_on_close([](int exit_code, const std::string &signal_name) {
        debug_log::log("browser close event: code=" + std::to_string(exit_code) +
                       (signal_name.empty() ? "" : " signal=" + signal_name));
    });

    browser_server::StartResult start_result = server.start();
    if (!start_result.success) {
        std::cerr << "[wkmux] " << start_result.message;
        if (!start_result.error_detail.empty()) {
            std::cerr << " " << start_result.error_detail;
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << "Listening on " << server.ws_endpoint() << std::endl;

    int exit_code = server.run();
    debug_log::log("event loop finished, exit code " + std::to_string(exit_code));
    return exit_code;
}
