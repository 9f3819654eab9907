#ifndef WKMUX_BROWSER_SERVER_HPP
#define WKMUX_BROWSER_SERVER_HPP

// One launched browser shared over a WebSocket endpoint.
// Owns the process supervisor, the pipe transport, the session router and
// the listener, and drives all of them from a single event loop.

#include <functional>
#include <memory>
#include <string>

#include "server/launch_options.hpp"
#include "server/pipe_transport.hpp"
#include "server/process_supervisor.hpp"
#include "server/session_router.hpp"
#include "server/websocket_server.hpp"

namespace browser_server {

// Interval the loop waits on each I/O source per turn.
constexpr int SERVICE_INTERVAL_MILLISECONDS = 10;

struct StartResult {
    bool success = false;
    process_supervisor::LaunchError launch_error = process_supervisor::LaunchError::kNone;
    std::string message;
    std::string error_detail;
};

class BrowserServer {
public:
    using CloseCallback = std::function<void(int exit_code, const std::string &signal_name)>;

    explicit BrowserServer(launch_options::LaunchOptions options);
    ~BrowserServer();

    BrowserServer(const BrowserServer &) = delete;
    BrowserServer &operator=(const BrowserServer &) = delete;

    // Launch the browser, connect the pipe and start listening.
    StartResult start();

    // Run the event loop until the browser has exited. Returns the browser's
    // exit code, or 1 when it died from a signal.
    int run();

    // One loop turn. Returns false once the browser has exited and the pipe is closed.
    bool run_once();

    // Ask the browser to close; it is killed after the grace period.
    void close();

    // Kill the browser immediately.
    void kill();

    // Fired once when the browser process exits.
    void set_on_close(CloseCallback callback) { on_close_ = std::move(callback); }

    const std::string &ws_endpoint() const;
    const std::string &downloads_path() const { return supervisor_.handle().downloads_path; }
    int process_id() const { return supervisor_.handle().process_id; }

    // Messages read from the browser pipe and handed to the router.
    size_t browser_message_count() const { return browser_message_count_; }

private:
    void handle_process_exit(int exit_code, const std::string &signal_name);
    void handle_transport_close(connection_transport::TransportCloseReason reason);

    launch_options::LaunchOptions options_;
    process_supervisor::ProcessSupervisor supervisor_;
    std::unique_ptr<pipe_transport::PipeTransport> transport_;
    std::unique_ptr<session_router::SessionRouter> router_;
    std::unique_ptr<websocket_server::WebSocketServer> websocket_server_;
    CloseCallback on_close_;

    size_t browser_message_count_ = 0;
    int forwarded_signal_ = 0;
    int exit_code_ = -1;
    std::string exit_signal_;
};

} // namespace browser_server

#endif // WKMUX_BROWSER_SERVER_HPP
