#include "server/process_supervisor.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <exception>
#include <iostream>
#include <utility>

namespace process_supervisor {

std::string describe(LaunchError error) {
    switch (error) {
    case LaunchError::kNone: return "none";
    case LaunchError::kExecutableNotFound: return "executable not found";
    case LaunchError::kPipeCreationFailed: return "pipe creation failed";
    case LaunchError::kSpawnFailed: return "spawn failed";
    }
    return "unknown";
}

ProcessSupervisor::~ProcessSupervisor() {
    if (state_ == SupervisorState::kIdle || state_ == SupervisorState::kTerminated) {
        return;
    }
    debug_log::log("supervisor: destroyed with live browser pid=" + std::to_string(handle_.process_id) + ", killing");
    platform::kill_process(handle_.process_id, SIGKILL);
    int status = 0;
    waitpid(static_cast<pid_t>(handle_.process_id), &status, 0);
    restore_signal_handlers();
    remove_temp_directories();
}

LaunchResult ProcessSupervisor::launch(LaunchParams params) {
    LaunchResult result;
    if (state_ != SupervisorState::kIdle) {
        result.error = LaunchError::kSpawnFailed;
        result.error_message = "Browser process was already launched by this supervisor.";
        return result;
    }

    params_ = std::move(params);
    if (!params_.temp_directory.empty()) {
        handle_.temp_directory = params_.temp_directory;
    }

    if (params_.executable_path.empty() || access(params_.executable_path.c_str(), X_OK) != 0) {
        result.error = LaunchError::kExecutableNotFound;
        result.error_message = "Failed to launch browser: executable not found or not executable: '" +
                               params_.executable_path + "'";
        remove_temp_directories();
        return result;
    }

    handle_.downloads_path = platform::make_temp_directory("wkmux_downloads-");
    if (handle_.downloads_path.empty()) {
        debug_log::log("supervisor: could not create downloads directory, continuing without one");
    }

    debug_log::log("supervisor: spawning " + params_.executable_path + " with " +
                   std::to_string(params_.arguments.size()) + " argument(s)");
    platform::SpawnResult spawn_result =
        platform::spawn_process(params_.executable_path, params_.arguments, params_.environment);
    if (!spawn_result.success) {
        result.error = spawn_result.pipe_creation_failed ? LaunchError::kPipeCreationFailed
                                                         : LaunchError::kSpawnFailed;
        result.error_message = "Failed to launch browser: " + spawn_result.error_message;
        remove_temp_directories();
        return result;
    }

    handle_.process_id = spawn_result.process_id;
    handle_.pipe_read_descriptor = spawn_result.pipe_read_descriptor;
    handle_.pipe_write_descriptor = spawn_result.pipe_write_descriptor;
    state_ = SupervisorState::kRunning;
    install_signal_handlers(params_.signal_policy);

    std::cerr << "[wkmux] Browser launched (pid=" << handle_.process_id << ")" << std::endl;

    result.success = true;
    result.handle = handle_;
    return result;
}

void ProcessSupervisor::close(Clock::time_point now) {
    if (state_ != SupervisorState::kRunning) {
        return;
    }
    if (!params_.attempt_to_gracefully_close) {
        force_kill();
        return;
    }

    state_ = SupervisorState::kGracefulWait;
    graceful_deadline_ = now + params_.grace_period;
    debug_log::log("supervisor: graceful close, deadline in " +
                   std::to_string(params_.grace_period.count()) + " ms");
    try {
        params_.attempt_to_gracefully_close();
    } catch (const std::exception &error) {
        // The deadline stays armed; the forced kill still happens.
        std::cerr << "[wkmux] Graceful close hook failed: " << error.what() << std::endl;
    }
}

void ProcessSupervisor::kill() {
    if (state_ == SupervisorState::kRunning || state_ == SupervisorState::kGracefulWait) {
        force_kill();
    }
}

void ProcessSupervisor::tick(Clock::time_point now) {
    if (state_ == SupervisorState::kGracefulWait && now >= graceful_deadline_) {
        std::cerr << "[wkmux] Browser did not exit within the grace period, killing pid="
                  << handle_.process_id << std::endl;
        force_kill();
    }
}

bool ProcessSupervisor::poll_exit() {
    if (state_ == SupervisorState::kRunning || state_ == SupervisorState::kGracefulWait ||
        state_ == SupervisorState::kForcedKill) {
        platform::ProcessExitStatus exit_status = platform::poll_process_exit(handle_.process_id);
        if (exit_status.exited) {
            finish(exit_status.exit_code,
                   exit_status.signal_number != 0 ? platform::signal_name(exit_status.signal_number) : "");
        }
    }
    return state_ == SupervisorState::kTerminated;
}

void ProcessSupervisor::force_kill() {
    debug_log::log("supervisor: SIGKILL pid=" + std::to_string(handle_.process_id));
    if (!platform::kill_process(handle_.process_id, SIGKILL)) {
        debug_log::log("supervisor: kill failed, process probably already gone");
    }
    state_ = SupervisorState::kForcedKill;
}

void ProcessSupervisor::finish(int exit_code, const std::string &signal_name) {
    state_ = SupervisorState::kTerminated;
    exit_code_ = exit_code;
    exit_signal_ = signal_name;
    restore_signal_handlers();
    remove_temp_directories();

    std::cerr << "[wkmux] Browser exited (pid=" << handle_.process_id << ", code=" << exit_code
              << (signal_name.empty() ? "" : ", signal=" + signal_name) << ")" << std::endl;

    auto on_exit = std::move(params_.on_exit);
    params_.on_exit = nullptr;
    if (on_exit) {
        on_exit(exit_code, signal_name);
    }
}

void ProcessSupervisor::remove_temp_directories() {
    if (handle_.temp_directory && !platform::remove_directory(*handle_.temp_directory)) {
        debug_log::log("supervisor: could not remove " + *handle_.temp_directory);
    }
    if (!handle_.downloads_path.empty() && !platform::remove_directory(handle_.downloads_path)) {
        debug_log::log("supervisor: could not remove " + handle_.downloads_path);
    }
}

// --- Signal forwarding ---

static volatile std::sig_atomic_t pending_signal = 0;

static const int FORWARDED_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP};
static struct sigaction previous_actions[3];
static bool installed_actions[3] = {false, false, false};

static void record_signal(int signal_number) {
    pending_signal = signal_number;
}

void install_signal_handlers(const SignalPolicy &policy) {
    const bool wanted[3] = {policy.handle_sigint, policy.handle_sigterm, policy.handle_sighup};
    for (int index = 0; index < 3; ++index) {
        if (!wanted[index] || installed_actions[index]) {
            continue;
        }
        struct sigaction action = {};
        action.sa_handler = record_signal;
        sigemptyset(&action.sa_mask);
        if (sigaction(FORWARDED_SIGNALS[index], &action, &previous_actions[index]) == 0) {
            installed_actions[index] = true;
        }
    }
}

void restore_signal_handlers() {
    for (int index = 0; index < 3; ++index) {
        if (!installed_actions[index]) {
            continue;
        }
        sigaction(FORWARDED_SIGNALS[index], &previous_actions[index], nullptr);
        installed_actions[index] = false;
    }
}

int take_pending_signal() {
    int signal_number = pending_signal;
    pending_signal = 0;
    return signal_number;
}

void reraise_signal(int signal_number) {
    restore_signal_handlers();
    std::signal(signal_number, SIG_DFL);
    std::raise(signal_number);
}

} // namespace process_supervisor
