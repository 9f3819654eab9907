// Test runner: runs every suite and reports results.

#include <csignal>
#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_sequence_id_mixer {
    bool run_all_tests();
}

namespace test_session_router {
    bool run_all_tests();
}

namespace test_pipe_transport {
    bool run_all_tests();
}

namespace test_process_supervisor {
    bool run_all_tests();
}

namespace test_launch_options {
    bool run_all_tests();
}

namespace test_websocket_server {
    bool run_all_tests();
}

namespace test_browser_server {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    // Pipe write failures must come back as errors, as they do in wkmux itself.
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<TestSuite> suites = {
        {"test_sequence_id_mixer", test_sequence_id_mixer::run_all_tests},
        {"test_session_router", test_session_router::run_all_tests},
        {"test_pipe_transport", test_pipe_transport::run_all_tests},
        {"test_process_supervisor", test_process_supervisor::run_all_tests},
        {"test_launch_options", test_launch_options::run_all_tests},
        {"test_websocket_server", test_websocket_server::run_all_tests},
        {"test_browser_server", test_browser_server::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== wkmux Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
