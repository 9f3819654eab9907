#include "server/launch_options.hpp"
#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace launch_options {

// Browser executable names searched on PATH.
static const std::vector<std::string> BROWSER_EXECUTABLE_NAMES = {
    "pw_run.sh",
    "MiniBrowser",
};

// Well-known install locations on Linux.
static const std::vector<std::string> BROWSER_EXECUTABLE_PATHS = {
    "/usr/bin/MiniBrowser",
    "/usr/libexec/webkit2gtk-4.0/MiniBrowser",
    "/usr/lib/x86_64-linux-gnu/webkit2gtk-4.0/MiniBrowser",
    "/usr/lib/aarch64-linux-gnu/webkit2gtk-4.0/MiniBrowser",
};

static std::vector<std::string> default_arguments(const LaunchOptions &options) {
    std::vector<std::string> arguments = {"--inspector-pipe"};
    if (options.headless) {
        arguments.push_back("--headless");
    }
    arguments.push_back("--no-startup-window");
    return arguments;
}

ArgumentsResult build_browser_arguments(const LaunchOptions &options) {
    ArgumentsResult result;

    if (options.devtools) {
        std::cerr << "[wkmux] devtools parameter as a launch argument is not supported by this browser." << std::endl;
    }
    for (const auto &argument : options.args) {
        if (argument.rfind("--user-data-dir=", 0) == 0) {
            result.error_message = "Pass userDataDir parameter instead of specifying --user-data-dir argument";
            return result;
        }
        if (argument.empty() || argument[0] != '-') {
            result.error_message = "Arguments can not specify page to be opened";
            return result;
        }
    }

    if (options.ignore_default_args) {
        result.arguments = options.args;
        result.success = true;
        return result;
    }

    for (const auto &argument : default_arguments(options)) {
        bool ignored = std::find(options.ignored_default_args.begin(), options.ignored_default_args.end(),
                                 argument) != options.ignored_default_args.end();
        if (!ignored) {
            result.arguments.push_back(argument);
        }
    }
    result.arguments.insert(result.arguments.end(), options.args.begin(), options.args.end());
    result.success = true;
    return result;
}

std::map<std::string, std::string> build_environment(const LaunchOptions &options,
                                                     const std::string &user_data_dir) {
    std::map<std::string, std::string> environment =
        options.env ? *options.env : platform::current_environment();
    environment[COOKIE_JAR_ENVIRONMENT_VARIABLE] = user_data_dir + "/cookiejar.db";
    return environment;
}

std::string find_browser_executable() {
    const char *override_path = std::getenv(BROWSER_PATH_ENVIRONMENT_VARIABLE);
    if (override_path != nullptr && override_path[0] != '\0') {
        return override_path;
    }
    for (const auto &name : BROWSER_EXECUTABLE_NAMES) {
        std::string full_path = platform::find_on_path(name);
        if (!full_path.empty()) {
            return full_path;
        }
    }
    for (const auto &candidate : BROWSER_EXECUTABLE_PATHS) {
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

static bool parse_integer(const std::string &text, int &value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

CommandLineResult parse_command_line(const std::vector<std::string> &arguments) {
    CommandLineResult result;
    LaunchOptions &options = result.options;

    for (size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];
        bool has_value = index + 1 < arguments.size();

        if (argument == "--") {
            options.args.insert(options.args.end(), arguments.begin() + static_cast<long>(index) + 1,
                                arguments.end());
            break;
        }
        if (argument == "-h" || argument == "--help") {
            result.show_help = true;
            result.success = true;
            return result;
        }
        if (argument == "--headful") {
            options.headless = false;
        } else if (argument == "--devtools") {
            options.devtools = true;
        } else if (argument == "--ignore-default-args") {
            options.ignore_default_args = true;
        } else if (argument == "--no-handle-sigint") {
            options.signal_policy.handle_sigint = false;
        } else if (argument == "--no-handle-sigterm") {
            options.signal_policy.handle_sigterm = false;
        } else if (argument == "--no-handle-sighup") {
            options.signal_policy.handle_sighup = false;
        } else if (argument == "--port" && has_value) {
            if (!parse_integer(arguments[++index], options.port) || options.port < 0 || options.port > 65535) {
                result.error_message = "Invalid --port value: " + arguments[index];
                return result;
            }
        } else if (argument == "--grace-period-ms" && has_value) {
            int milliseconds = 0;
            if (!parse_integer(arguments[++index], milliseconds) || milliseconds < 0) {
                result.error_message = "Invalid --grace-period-ms value: " + arguments[index];
                return result;
            }
            options.grace_period = std::chrono::milliseconds(milliseconds);
        } else if (argument == "--ignore-default-arg" && has_value) {
            options.ignored_default_args.push_back(arguments[++index]);
        } else if (argument == "--executable" && has_value) {
            options.executable_path = arguments[++index];
        } else if (argument == "--user-data-dir" && has_value) {
            options.user_data_dir = arguments[++index];
        } else {
            result.error_message = "Unknown or incomplete option: " + argument;
            return result;
        }
    }

    result.success = true;
    return result;
}

std::string usage() {
    return "Usage: wkmux [options] [-- browser arguments...]\n"
           "\n"
           "Launches the browser with a protocol pipe and shares it between\n"
           "WebSocket clients connecting to the published endpoint.\n"
           "\n"
           "Options:\n"
           "  --port N               listen port (default: any free port)\n"
           "  --executable PATH      browser executable (default: $WKMUX_BROWSER_PATH or search)\n"
           "  --user-data-dir DIR    profile directory (default: temporary)\n"
           "  --headful              do not pass --headless\n"
           "  --devtools             accepted for compatibility, ignored\n"
           "  --ignore-default-args  pass only the browser arguments given after --\n"
           "  --ignore-default-arg ARG  leave out one default argument (repeatable)\n"
           "  --grace-period-ms N    time to wait for a graceful close (default: 5000)\n"
           "  --no-handle-sigint     do not close the browser on SIGINT\n"
           "  --no-handle-sigterm    do not close the browser on SIGTERM\n"
           "  --no-handle-sighup     do not close the browser on SIGHUP\n"
           "  -h, --help             show this help\n"
           "\n"
           "Set WKMUX_DEBUG=1 for protocol traces on stderr.\n";
}

} // namespace launch_options
