// Tests for the NUL-delimited pipe transport: frame reassembly, malformed
// frames, end-of-stream handling, deferred write failures, and a round trip
// through a real child process wired the way the browser is.

#include "server/pipe_transport.hpp"
#include "platform/platform_abi.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using connection_transport::TransportCloseReason;

namespace test_pipe_transport {

static bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static void write_all(int descriptor, const std::string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = write(descriptor, data.data() + offset, data.size() - offset);
        if (written <= 0) {
            return;
        }
        offset += static_cast<size_t>(written);
    }
}

// Pipes around a transport: the test plays the browser on the far ends.
struct PipeFixture {
    int browser_write = -1;  // test writes here, transport reads
    int browser_read = -1;   // transport writes, test reads here
    pipe_transport::PipeTransport *transport = nullptr;

    std::vector<json> messages;
    std::vector<TransportCloseReason> close_reasons;

    PipeFixture() {
        int inbound[2];
        int outbound[2];
        if (pipe2(inbound, O_CLOEXEC) != 0 || pipe2(outbound, O_CLOEXEC) != 0) {
            return;
        }
        browser_write = inbound[1];
        browser_read = outbound[0];
        transport = new pipe_transport::PipeTransport(inbound[0], outbound[1]);
        transport->set_on_message([this](const json &message) { messages.push_back(message); });
        transport->set_on_close([this](TransportCloseReason reason) { close_reasons.push_back(reason); });
    }

    ~PipeFixture() {
        delete transport;
        if (browser_write >= 0) {
            close(browser_write);
        }
        if (browser_read >= 0) {
            close(browser_read);
        }
    }

    void close_browser_write() {
        close(browser_write);
        browser_write = -1;
    }

    void close_browser_read() {
        close(browser_read);
        browser_read = -1;
    }

    void service_until(size_t message_count) {
        for (int turn = 0; turn < 100 && messages.size() < message_count && !transport->is_closed(); ++turn) {
            transport->service(10);
        }
    }
};

// Test: frames split across reads and several frames in one read are reassembled in order.
static bool test_frame_decoder_reassembly() {
    pipe_transport::FrameDecoder decoder;
    std::vector<std::string> frames;
    std::string first_chunk = std::string("{\"id\":1}") + '\0' + "{\"id\"";
    std::string second_chunk = std::string(":2}") + '\0' + "{\"method\":\"x\"}" + '\0';

    decoder.feed(first_chunk.data(), first_chunk.size(), frames);
    bool passed = check(frames.size() == 1 && decoder.has_partial_frame(), "partial frame buffered after first read");
    decoder.feed(second_chunk.data(), second_chunk.size(), frames);
    passed &= check(frames.size() == 3 && !decoder.has_partial_frame(), "all frames complete after second read");
    if (frames.size() == 3) {
        passed &= check(frames[0] == "{\"id\":1}" && frames[1] == "{\"id\":2}" && frames[2] == "{\"method\":\"x\"}",
                        "frames kept in arrival order");
    }
    return passed;
}

// Test: frames that are not JSON objects are rejected.
static bool test_decode_rejects_malformed_frames() {
    json message;
    std::string error_message;
    bool passed = check(!pipe_transport::decode_frame("", message, error_message), "empty frame rejected");
    passed &= check(!pipe_transport::decode_frame("{\"id\":", message, error_message), "truncated JSON rejected");
    passed &= check(!pipe_transport::decode_frame("[1,2,3]", message, error_message), "non-object JSON rejected");
    passed &= check(pipe_transport::decode_frame("{\"id\":3}", message, error_message) && message["id"] == 3,
                    "object frame accepted");

    std::string frame = pipe_transport::encode_frame(message);
    passed &= check(!frame.empty() && frame.back() == '\0' && frame.find('\0') == frame.size() - 1,
                    "encoded frame carries exactly one trailing NUL");
    return passed;
}

// Test: messages flow both ways over real pipes.
static bool test_send_and_receive_over_pipes() {
    PipeFixture fixture;
    if (fixture.transport == nullptr) {
        return check(false, "pipe fixture created");
    }

    json request;
    request["id"] = 11;
    request["method"] = "Playwright.createContext";
    fixture.transport->send(request);

    char buffer[256];
    ssize_t bytes_read = read(fixture.browser_read, buffer, sizeof(buffer));
    std::string raw = bytes_read > 0 ? std::string(buffer, static_cast<size_t>(bytes_read)) : "";
    bool passed = check(!raw.empty() && raw.back() == '\0', "outbound frame NUL-terminated");
    if (!raw.empty()) {
        passed &= check(json::parse(raw.substr(0, raw.size() - 1)) == request, "outbound frame carries the message");
    }

    write_all(fixture.browser_write, std::string("{\"id\":11,\"result\":{}}") + '\0' + "{\"method\":\"A\"}");
    fixture.service_until(1);
    write_all(fixture.browser_write, std::string("") + '\0' + "{\"method\":\"B\"}" + '\0');
    fixture.service_until(3);

    passed &= check(fixture.messages.size() == 3, "three inbound messages delivered");
    if (fixture.messages.size() == 3) {
        passed &= check(fixture.messages[0]["id"] == 11 && fixture.messages[1]["method"] == "A" &&
                            fixture.messages[2]["method"] == "B",
                        "inbound messages delivered in arrival order");
    }
    passed &= check(fixture.close_reasons.empty(), "transport still open");
    return passed;
}

// Test: a malformed frame closes the transport with a framing error and stops delivery.
static bool test_malformed_frame_is_fatal() {
    PipeFixture fixture;
    if (fixture.transport == nullptr) {
        return check(false, "pipe fixture created");
    }

    write_all(fixture.browser_write,
              std::string("{\"method\":\"ok\"}") + '\0' + "not json" + '\0' + "{\"method\":\"after\"}" + '\0');
    fixture.service_until(3);
    fixture.transport->service(10);

    bool passed = check(fixture.messages.size() == 1, "only the message before the bad frame delivered");
    passed &= check(fixture.close_reasons.size() == 1 &&
                        fixture.close_reasons[0] == TransportCloseReason::kFramingError,
                    "closed once with a framing error");
    passed &= check(fixture.transport->is_closed() && !fixture.transport->service(0), "service reports closed");

    json late;
    late["id"] = 1;
    fixture.transport->send(late);
    passed &= check(fixture.close_reasons.size() == 1, "send after close is a no-op");
    return passed;
}

// Test: clean end of stream versus a truncated trailing frame.
static bool test_end_of_stream() {
    bool passed = true;
    {
        PipeFixture fixture;
        if (fixture.transport == nullptr) {
            return check(false, "pipe fixture created");
        }
        write_all(fixture.browser_write, std::string("{\"method\":\"last\"}") + '\0');
        fixture.close_browser_write();
        fixture.service_until(2);
        passed &= check(fixture.messages.size() == 1, "message before EOF delivered");
        passed &= check(fixture.close_reasons.size() == 1 &&
                            fixture.close_reasons[0] == TransportCloseReason::kStreamEnded,
                        "clean EOF reported as stream ended");
    }
    {
        PipeFixture fixture;
        if (fixture.transport == nullptr) {
            return check(false, "pipe fixture created");
        }
        write_all(fixture.browser_write, "{\"method\":\"cut");
        fixture.close_browser_write();
        fixture.service_until(1);
        passed &= check(fixture.messages.empty(), "truncated frame not delivered");
        passed &= check(fixture.close_reasons.size() == 1 &&
                            fixture.close_reasons[0] == TransportCloseReason::kFramingError,
                        "truncated trailing frame reported as framing error");
    }
    return passed;
}

// Test: write failures are reported through the close callback on the next turn.
static bool test_write_failure_reported_asynchronously() {
    PipeFixture fixture;
    if (fixture.transport == nullptr) {
        return check(false, "pipe fixture created");
    }
    fixture.close_browser_read();

    json request;
    request["id"] = 1;
    fixture.transport->send(request);
    bool passed = check(fixture.close_reasons.empty(), "send does not report the failure synchronously");

    fixture.transport->service(0);
    passed &= check(fixture.close_reasons.size() == 1 &&
                        fixture.close_reasons[0] == TransportCloseReason::kWriteFailed,
                    "write failure reported as close on the next service turn");
    return passed;
}

// Test: a child wired like the browser (fd 3 in, fd 4 out) echoes frames back.
static bool test_round_trip_through_child_process() {
    platform::SpawnResult spawn_result = platform::spawn_process(
        "/bin/sh", {"-c", "exec cat <&3 >&4"}, platform::current_environment());
    if (!spawn_result.success) {
        return check(false, "spawned echo child: " + spawn_result.error_message);
    }

    std::vector<json> messages;
    bool passed = true;
    {
        pipe_transport::PipeTransport transport(spawn_result.pipe_read_descriptor,
                                                spawn_result.pipe_write_descriptor);
        transport.set_on_message([&messages](const json &message) { messages.push_back(message); });

        json first;
        first["id"] = 1;
        first["method"] = "Playwright.enable";
        json second;
        second["id"] = 2;
        second["method"] = "Playwright.createContext";
        transport.send(first);
        transport.send(second);

        for (int turn = 0; turn < 200 && messages.size() < 2; ++turn) {
            transport.service(10);
        }
        passed &= check(messages.size() == 2, "both frames echoed by the child");
        if (messages.size() == 2) {
            passed &= check(messages[0] == first && messages[1] == second, "echoed frames intact and ordered");
        }
        transport.close();
    }

    // Closing our ends gives cat EOF; reap it.
    platform::ProcessExitStatus exit_status;
    for (int turn = 0; turn < 200 && !exit_status.exited; ++turn) {
        exit_status = platform::poll_process_exit(spawn_result.process_id);
        if (!exit_status.exited) {
            usleep(10000);
        }
    }
    if (!exit_status.exited) {
        platform::kill_process(spawn_result.process_id, SIGKILL);
        waitpid(spawn_result.process_id, nullptr, 0);
    }
    passed &= check(exit_status.exited && exit_status.exit_code == 0, "child exited cleanly after pipe closed");
    return passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_frame_decoder_reassembly();
    all_passed &= test_decode_rejects_malformed_frames();
    all_passed &= test_send_and_receive_over_pipes();
    all_passed &= test_malformed_frame_is_fatal();
    all_passed &= test_end_of_stream();
    all_passed &= test_write_failure_reported_asynchronously();
    all_passed &= test_round_trip_through_child_process();
    return all_passed;
}

} // namespace test_pipe_transport
