#ifndef WKMUX_LAUNCH_OPTIONS_HPP
#define WKMUX_LAUNCH_OPTIONS_HPP

// Launch configuration: browser discovery, argument and environment assembly,
// and command-line parsing for the wkmux executable.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "server/process_supervisor.hpp"

namespace launch_options {

// Prefix of the temporary profile created when no user data dir is given.
static const char TEMP_PROFILE_PREFIX[] = "wkmux_dev_profile-";

// Environment variable naming the browser's persistent cookie jar.
static const char COOKIE_JAR_ENVIRONMENT_VARIABLE[] = "CURL_COOKIE_JAR_PATH";

// Environment variable overriding executable discovery.
static const char BROWSER_PATH_ENVIRONMENT_VARIABLE[] = "WKMUX_BROWSER_PATH";

struct LaunchOptions {
    std::string executable_path;  // empty = discover
    std::vector<std::string> args;
    // true: use args verbatim, without any default argument.
    bool ignore_default_args = false;
    // Default arguments to leave out (ignored when ignore_default_args is set).
    std::vector<std::string> ignored_default_args;
    bool headless = true;
    bool devtools = false;        // not supported by this browser, warned about
    std::string user_data_dir;    // empty = temporary profile
    // Child environment; the current environment when unset.
    std::optional<std::map<std::string, std::string>> env;
    int port = 0;                 // 0 = pick a free port
    std::chrono::milliseconds grace_period{5000};
    process_supervisor::SignalPolicy signal_policy;
};

struct ArgumentsResult {
    bool success = false;
    std::vector<std::string> arguments;
    std::string error_message;
};

// Build the browser argv (without argv[0]). Rejects --user-data-dir= in
// args and any argument that is not a flag.
ArgumentsResult build_browser_arguments(const LaunchOptions &options);

// Child environment: options.env (or the current one) plus the cookie jar
// path inside user_data_dir.
std::map<std::string, std::string> build_environment(const LaunchOptions &options,
                                                     const std::string &user_data_dir);

// Find the browser executable: WKMUX_BROWSER_PATH, then known names on PATH,
// then known install locations. Returns empty string if not found.
std::string find_browser_executable();

struct CommandLineResult {
    bool success = false;
    bool show_help = false;
    LaunchOptions options;
    std::string error_message;
};

// Parse wkmux's own command line. Everything after "--" goes to the browser.
CommandLineResult parse_command_line(const std::vector<std::string> &arguments);

// Usage text for --help.
std::string usage();

} // namespace launch_options

#endif // WKMUX_LAUNCH_OPTIONS_HPP
