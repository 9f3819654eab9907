#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <spawn.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

extern char **environ;

namespace platform {

// Child ends are parked above this descriptor before spawning so that the
// dup2 onto 3/4 never becomes a no-op that keeps close-on-exec set.
static constexpr int PARKED_DESCRIPTOR_FLOOR = 10;

static void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        close(descriptor);
        descriptor = -1;
    }
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::map<std::string, std::string> &environment) {
    SpawnResult result;

    int parent_to_child[2] = {-1, -1};
    int child_to_parent[2] = {-1, -1};
    if (pipe2(parent_to_child, O_CLOEXEC) != 0) {
        result.pipe_creation_failed = true;
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe2(child_to_parent, O_CLOEXEC) != 0) {
        result.pipe_creation_failed = true;
        result.error_message = "pipe2 failed: " + std::string(strerror(errno));
        close_descriptor(parent_to_child[0]);
        close_descriptor(parent_to_child[1]);
        return result;
    }

    int child_read = fcntl(parent_to_child[0], F_DUPFD_CLOEXEC, PARKED_DESCRIPTOR_FLOOR);
    int child_write = fcntl(child_to_parent[1], F_DUPFD_CLOEXEC, PARKED_DESCRIPTOR_FLOOR);
    close_descriptor(parent_to_child[0]);
    close_descriptor(child_to_parent[1]);
    if (child_read < 0 || child_write < 0) {
        result.pipe_creation_failed = true;
        result.error_message = "fcntl(F_DUPFD_CLOEXEC) failed: " + std::string(strerror(errno));
        close_descriptor(child_read);
        close_descriptor(child_write);
        close_descriptor(parent_to_child[1]);
        close_descriptor(child_to_parent[0]);
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    for (const auto &argument : arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings;
    for (const auto &entry : environment) {
        environment_strings.push_back(entry.first + "=" + entry.second);
    }
    std::vector<char *> environment_pointers;
    for (auto &environment_string : environment_strings) {
        environment_pointers.push_back(environment_string.data());
    }
    environment_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&file_actions, child_read, CHILD_PIPE_READ_DESCRIPTOR);
    posix_spawn_file_actions_adddup2(&file_actions, child_write, CHILD_PIPE_WRITE_DESCRIPTOR);

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, nullptr,
                                   argv_pointers.data(), environment_pointers.data());
    posix_spawn_file_actions_destroy(&file_actions);

    close_descriptor(child_read);
    close_descriptor(child_write);

    if (spawn_status != 0) {
        close_descriptor(parent_to_child[1]);
        close_descriptor(child_to_parent[0]);
        result.success = false;
        result.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.pipe_read_descriptor = child_to_parent[0];
    result.pipe_write_descriptor = parent_to_child[1];
    return result;
}

ProcessExitStatus poll_process_exit(int process_id) {
    ProcessExitStatus exit_status;
    if (process_id <= 0) {
        return exit_status;
    }

    int status = 0;
    pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
    if (wait_result == 0) {
        return exit_status;
    }
    if (wait_result < 0) {
        if (errno == ECHILD) {
            // Already reaped elsewhere; nothing more will be observed.
            exit_status.exited = true;
        }
        return exit_status;
    }

    exit_status.exited = true;
    if (WIFEXITED(status)) {
        exit_status.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status.signal_number = WTERMSIG(status);
    }
    return exit_status;
}

bool kill_process(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    int kill_result = kill(static_cast<pid_t>(process_id), signal_number);
    return (kill_result == 0);
}

std::string signal_name(int signal_number) {
    switch (signal_number) {
    case SIGHUP: return "SIGHUP";
    case SIGINT: return "SIGINT";
    case SIGQUIT: return "SIGQUIT";
    case SIGILL: return "SIGILL";
    case SIGTRAP: return "SIGTRAP";
    case SIGABRT: return "SIGABRT";
    case SIGBUS: return "SIGBUS";
    case SIGFPE: return "SIGFPE";
    case SIGKILL: return "SIGKILL";
    case SIGUSR1: return "SIGUSR1";
    case SIGSEGV: return "SIGSEGV";
    case SIGUSR2: return "SIGUSR2";
    case SIGPIPE: return "SIGPIPE";
    case SIGALRM: return "SIGALRM";
    case SIGTERM: return "SIGTERM";
    default: return "SIG" + std::to_string(signal_number);
    }
}

std::map<std::string, std::string> current_environment() {
    std::map<std::string, std::string> environment;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string pair(*entry);
        auto equals_position = pair.find('=');
        if (equals_position == std::string::npos) {
            continue;
        }
        environment[pair.substr(0, equals_position)] = pair.substr(equals_position + 1);
    }
    return environment;
}

std::string find_on_path(const std::string &executable_name) {
    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        return "";
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + executable_name;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }
    return "";
}

std::string make_temp_directory(const std::string &prefix) {
    std::error_code error;
    std::filesystem::path temp_root = std::filesystem::temp_directory_path(error);
    if (error) {
        temp_root = "/tmp";
    }
    std::string pattern = (temp_root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        return "";
    }
    return std::string(buffer.data());
}

bool remove_directory(const std::string &directory_path) {
    if (directory_path.empty()) {
        return false;
    }
    std::error_code error;
    std::filesystem::remove_all(directory_path, error);
    return !error;
}

bool set_non_blocking(int descriptor) {
    int flags = fcntl(descriptor, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(descriptor, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace platform
