#ifndef WKMUX_PROCESS_SUPERVISOR_HPP
#define WKMUX_PROCESS_SUPERVISOR_HPP

// Browser process lifecycle: spawn with the protocol pipe, graceful-then-forced
// shutdown, exit observation and host signal forwarding.

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace process_supervisor {

using Clock = std::chrono::steady_clock;

enum class LaunchError {
    kNone,
    kExecutableNotFound,
    kPipeCreationFailed,
    kSpawnFailed,
};

std::string describe(LaunchError error);

// Running -> GracefulWait -> (ForcedKill) -> Terminated.
enum class SupervisorState {
    kIdle,
    kRunning,
    kGracefulWait,
    kForcedKill,
    kTerminated,
};

// Host signals that are turned into a graceful browser close.
struct SignalPolicy {
    bool handle_sigint = true;
    bool handle_sigterm = true;
    bool handle_sighup = true;
};

struct LaunchParams {
    std::string executable_path;
    std::vector<std::string> arguments;
    std::map<std::string, std::string> environment;
    SignalPolicy signal_policy;
    // Temporary profile to delete once the process is gone. Empty for none.
    std::string temp_directory;
    std::chrono::milliseconds grace_period{5000};
    // Sends the protocol-level close; invoked once when close() starts.
    std::function<void()> attempt_to_gracefully_close;
    // Fired exactly once when the exit is observed. exit_code is -1 when the
    // process died from a signal; signal_name is empty otherwise.
    std::function<void(int exit_code, const std::string &signal_name)> on_exit;
};

struct BrowserProcessHandle {
    int process_id = -1;
    int pipe_read_descriptor = -1;
    int pipe_write_descriptor = -1;
    std::string downloads_path;
    std::optional<std::string> temp_directory;
};

struct LaunchResult {
    bool success = false;
    LaunchError error = LaunchError::kNone;
    std::string error_message;
    BrowserProcessHandle handle;
};

class ProcessSupervisor {
public:
    ProcessSupervisor() = default;
    // A still-running child is killed and reaped; on_exit is not fired.
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Spawn the browser. Pipe descriptors in the returned handle belong to the caller.
    LaunchResult launch(LaunchParams params);

    // Start graceful shutdown: run the close hook and arm the kill deadline.
    void close(Clock::time_point now = Clock::now());

    // Skip the grace period and SIGKILL the browser.
    void kill();

    // Fire the forced kill once the graceful deadline has passed.
    void tick(Clock::time_point now = Clock::now());

    // Reap the child if it exited. Returns true once terminated.
    bool poll_exit();

    SupervisorState state() const { return state_; }
    bool is_terminated() const { return state_ == SupervisorState::kTerminated; }
    const BrowserProcessHandle &handle() const { return handle_; }
    int exit_code() const { return exit_code_; }
    const std::string &exit_signal() const { return exit_signal_; }

private:
    void force_kill();
    void finish(int exit_code, const std::string &signal_name);
    void remove_temp_directories();

    LaunchParams params_;
    BrowserProcessHandle handle_;
    SupervisorState state_ = SupervisorState::kIdle;
    Clock::time_point graceful_deadline_;
    int exit_code_ = -1;
    std::string exit_signal_;
};

// Host signal forwarding. The handler only records the signal; the owner's
// loop takes it, closes the browser and then re-raises it.
void install_signal_handlers(const SignalPolicy &policy);
void restore_signal_handlers();

// Returns the pending forwarded signal and clears it, or 0 when none.
int take_pending_signal();

// Restore the default disposition and deliver signal_number to this process.
void reraise_signal(int signal_number);

} // namespace process_supervisor

#endif // WKMUX_PROCESS_SUPERVISOR_HPP
