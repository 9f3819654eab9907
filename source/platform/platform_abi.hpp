#ifndef WKMUX_PLATFORM_ABI_HPP
#define WKMUX_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <map>
#include <string>
#include <vector>

namespace platform {

// Descriptor numbers the child sees for the protocol pipe.
constexpr int CHILD_PIPE_READ_DESCRIPTOR = 3;
constexpr int CHILD_PIPE_WRITE_DESCRIPTOR = 4;

// Result of spawning a child process with a protocol pipe pair.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    // Parent ends of the pipe pair. Both are close-on-exec.
    int pipe_read_descriptor = -1;  // receives what the child writes on fd 4
    int pipe_write_descriptor = -1; // feeds what the child reads on fd 3
    bool pipe_creation_failed = false;
    std::string error_message;
};

// Spawn a child process with the given executable path, arguments and environment.
// The child gets /dev/null on stdin, inherits stdout/stderr, and has the
// protocol pipe on descriptors 3 (read) and 4 (write).
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::map<std::string, std::string> &environment);

// Exit status observed for a child process.
struct ProcessExitStatus {
    bool exited = false;
    int exit_code = -1;     // -1 when terminated by a signal
    int signal_number = 0;  // 0 when exited normally
};

// Non-blocking check for child exit (reaps the child when it has exited).
ProcessExitStatus poll_process_exit(int process_id);

// Send a signal to a process by its process ID.
bool kill_process(int process_id, int signal_number);

// Symbolic name of a signal ("SIGKILL"), or "SIG<number>" for unknown ones.
std::string signal_name(int signal_number);

// Snapshot of the current process environment.
std::map<std::string, std::string> current_environment();

// Search PATH for a bare executable name. Returns empty string if not found.
std::string find_on_path(const std::string &executable_name);

// Create a unique directory "<temp>/<prefix>XXXXXX". Returns empty string on failure.
std::string make_temp_directory(const std::string &prefix);

// Remove a directory tree. Returns false if anything could not be removed.
bool remove_directory(const std::string &directory_path);

// Put a descriptor into non-blocking mode.
bool set_non_blocking(int descriptor);

} // namespace platform

#endif // WKMUX_PLATFORM_ABI_HPP
