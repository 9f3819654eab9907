#include "server/browser_server.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/protocol_message.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace browser_server {

// Loop turns spent flushing close frames to clients after the browser is gone.
static constexpr int CLOSE_FLUSH_TURNS = 10;

// Service turns spent reading what an exited browser left in the pipe. A
// descendant still holding the write end keeps the pipe open; give up then.
static constexpr int EXIT_DRAIN_TURNS = 1024;

BrowserServer::BrowserServer(launch_options::LaunchOptions options) : options_(std::move(options)) {}

BrowserServer::~BrowserServer() {
    // Listener first: its teardown unregisters sessions from the router,
    // which may still send context deletions over the pipe.
    websocket_server_.reset();
    router_.reset();
    transport_.reset();
}

StartResult BrowserServer::start() {
    StartResult result;

    std::string executable_path = options_.executable_path;
    if (executable_path.empty()) {
        executable_path = launch_options::find_browser_executable();
    }
    if (executable_path.empty()) {
        result.launch_error = process_supervisor::LaunchError::kExecutableNotFound;
        result.message = "No executable path is specified.";
        result.error_detail = std::string("Pass --executable or set ") +
                              launch_options::BROWSER_PATH_ENVIRONMENT_VARIABLE + ".";
        return result;
    }

    launch_options::ArgumentsResult arguments = launch_options::build_browser_arguments(options_);
    if (!arguments.success) {
        result.message = "Invalid browser arguments.";
        result.error_detail = arguments.error_message;
        return result;
    }

    std::string user_data_dir = options_.user_data_dir;
    std::string temporary_user_data_dir;
    if (user_data_dir.empty()) {
        temporary_user_data_dir = platform::make_temp_directory(launch_options::TEMP_PROFILE_PREFIX);
        if (temporary_user_data_dir.empty()) {
            result.message = "Failed to create a temporary profile directory.";
            return result;
        }
        user_data_dir = temporary_user_data_dir;
    }

    process_supervisor::LaunchParams params;
    params.executable_path = executable_path;
    params.arguments = arguments.arguments;
    params.environment = launch_options::build_environment(options_, user_data_dir);
    params.signal_policy = options_.signal_policy;
    params.temp_directory = temporary_user_data_dir;
    params.grace_period = options_.grace_period;
    params.attempt_to_gracefully_close = [this] {
        // Reusing the pipe is fine: the router ignores the reserved close id.
        if (transport_ && !transport_->is_closed()) {
            transport_->send(protocol_message::build_browser_close_request());
        }
    };
    params.on_exit = [this](int exit_code, const std::string &signal_name) {
        handle_process_exit(exit_code, signal_name);
    };

    process_supervisor::LaunchResult launch_result = supervisor_.launch(std::move(params));
    if (!launch_result.success) {
        result.launch_error = launch_result.error;
        result.message = "Failed to launch browser.";
        result.error_detail = launch_result.error_message;
        return result;
    }

    transport_ = std::make_unique<pipe_transport::PipeTransport>(launch_result.handle.pipe_read_descriptor,
                                                                 launch_result.handle.pipe_write_descriptor);
    router_ = std::make_unique<session_router::SessionRouter>(*transport_);
    transport_->set_on_message([this](const pipe_transport::json &message) {
        ++browser_message_count_;
        router_->on_transport_message(message);
    });
    transport_->set_on_close([this](connection_transport::TransportCloseReason reason) {
        handle_transport_close(reason);
    });

    websocket_server_ = std::make_unique<websocket_server::WebSocketServer>(*router_);
    websocket_server::ListenResult listen_result = websocket_server_->listen(options_.port);
    if (!listen_result.success) {
        result.message = "Failed to start WebSocket server.";
        result.error_detail = listen_result.error_message;
        supervisor_.kill();
        return result;
    }

    debug_log::log_always("Listening on " + websocket_server_->endpoint());
    result.success = true;
    result.message = websocket_server_->endpoint();
    return result;
}

int BrowserServer::run() {
    while (run_once()) {
    }
    for (int turn = 0; turn < CLOSE_FLUSH_TURNS && websocket_server_ && websocket_server_->connection_count() > 0; ++turn) {
        websocket_server_->service(SERVICE_INTERVAL_MILLISECONDS);
    }
    if (forwarded_signal_ != 0) {
        debug_log::log("re-raising " + platform::signal_name(forwarded_signal_));
        process_supervisor::reraise_signal(forwarded_signal_);
    }
    return exit_code_ >= 0 ? exit_code_ : 1;
}

bool BrowserServer::run_once() {
    bool transport_open = transport_ && !transport_->is_closed();
    if (websocket_server_) {
        websocket_server_->service(transport_open ? 0 : SERVICE_INTERVAL_MILLISECONDS);
    }
    if (transport_open) {
        transport_->service(SERVICE_INTERVAL_MILLISECONDS);
    }

    int signal_number = process_supervisor::take_pending_signal();
    if (signal_number != 0 && forwarded_signal_ == 0) {
        debug_log::log_always("Received " + platform::signal_name(signal_number) + ", closing browser.");
        forwarded_signal_ = signal_number;
        supervisor_.close();
    }

    supervisor_.tick();
    supervisor_.poll_exit();
    bool transport_closed = !transport_ || transport_->is_closed();
    return !(supervisor_.is_terminated() && transport_closed);
}

void BrowserServer::close() {
    supervisor_.close();
}

void BrowserServer::kill() {
    supervisor_.kill();
}

const std::string &BrowserServer::ws_endpoint() const {
    static const std::string empty_endpoint;
    return websocket_server_ ? websocket_server_->endpoint() : empty_endpoint;
}

void BrowserServer::handle_process_exit(int exit_code, const std::string &signal_name) {
    exit_code_ = exit_code;
    exit_signal_ = signal_name;
    // Deliver whatever the browser wrote before exiting, up to end of stream.
    for (int turn = 0; turn < EXIT_DRAIN_TURNS && transport_ && transport_->service(0); ++turn) {
    }
    if (transport_ && !transport_->is_closed()) {
        debug_log::log("browser pipe still open after exit, closing it");
        transport_->close();
    }
    if (on_close_) {
        on_close_(exit_code, signal_name);
    }
}

void BrowserServer::handle_transport_close(connection_transport::TransportCloseReason reason) {
    debug_log::log("browser pipe closed: " + connection_transport::describe(reason) + " after " +
                   std::to_string(browser_message_count_) + " message(s)");
    router_->on_transport_close();
    if (websocket_server_) {
        websocket_server_->stop_accepting();
    }
    if (!supervisor_.is_terminated()) {
        // The pipe cannot be trusted any more; the browser has to go.
        supervisor_.close();
    }
}

} // namespace browser_server
