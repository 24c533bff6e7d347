// Tests for the Linux platform layer: environment merging, executable lookup,
// spawning with pipes, liveness and termination.

#include "platform/platform_abi.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cstddef>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using test_support::check;

namespace test_platform {

static bool contains_entry(const std::vector<std::string> &environment, const std::string &entry) {
    return std::find(environment.begin(), environment.end(), entry) != environment.end();
}

static size_t count_key(const std::vector<std::string> &environment, const std::string &key) {
    return static_cast<size_t>(std::count_if(environment.begin(), environment.end(),
                                             [&key](const std::string &entry) {
                                                 return entry.compare(0, key.size() + 1, key + "=") == 0;
                                             }));
}

// Test: overrides win over inherited values and new keys are added.
static bool test_build_environment_merges_overrides() {
    setenv("SMCPC_TEST_INHERITED", "inherited", 1);
    setenv("SMCPC_TEST_REPLACED", "old", 1);

    platform::EnvironmentOverrides overrides;
    overrides["SMCPC_TEST_REPLACED"] = "new";
    overrides["SMCPC_TEST_ADDED"] = "added";
    std::vector<std::string> environment = platform::build_environment(overrides);

    bool success = contains_entry(environment, "SMCPC_TEST_INHERITED=inherited") &&
                   contains_entry(environment, "SMCPC_TEST_REPLACED=new") &&
                   !contains_entry(environment, "SMCPC_TEST_REPLACED=old") &&
                   count_key(environment, "SMCPC_TEST_REPLACED") == 1 &&
                   contains_entry(environment, "SMCPC_TEST_ADDED=added");

    unsetenv("SMCPC_TEST_INHERITED");
    unsetenv("SMCPC_TEST_REPLACED");
    return check(success, "Environment overrides replace inherited keys and add new ones");
}

// Test: the process environment itself is not modified.
static bool test_build_environment_leaves_process_untouched() {
    unsetenv("SMCPC_TEST_ONLY_IN_CHILD");
    platform::EnvironmentOverrides overrides;
    overrides["SMCPC_TEST_ONLY_IN_CHILD"] = "1";
    platform::build_environment(overrides);
    return check(std::getenv("SMCPC_TEST_ONLY_IN_CHILD") == nullptr,
                 "Building a child environment does not touch our own");
}

// Test: executable lookup honours the child's PATH.
static bool test_find_executable() {
    std::vector<std::string> environment = {"PATH=/nonexistent-dir:/bin:/usr/bin"};
    bool all_passed = true;

    std::string shell = platform::find_executable("sh", environment);
    all_passed &= check(!shell.empty() && shell.find("/sh") != std::string::npos,
                        "Bare name found on PATH (" + shell + ")");
    all_passed &= check(platform::find_executable("/nonexistent/binary", environment).empty(),
                        "Missing absolute path is not found");
    all_passed &= check(platform::find_executable("smcpc-no-such-command", environment).empty(),
                        "Unknown bare name is not found");
    all_passed &= check(platform::find_executable("/tmp", environment).empty(),
                        "A directory is not an executable");
    all_passed &= check(platform::find_executable(test_support::mock_server_path(), environment) ==
                            test_support::mock_server_path(),
                        "Path with a slash is used as given");
    return all_passed;
}

// Test: a spawned cat echoes through the pipes and terminates cleanly.
static bool test_spawn_and_round_trip_through_cat() {
    platform::SpawnResult spawn_result =
        platform::spawn_process("/bin/cat", {}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned /bin/cat")) {
        std::cout << "    " << spawn_result.error_message << std::endl;
        return false;
    }

    std::string error_message;
    const std::string line = "hello\n";
    size_t offset = 0;
    bool written = platform::write_chunk(spawn_result.stdin_descriptor, line, offset, error_message) ==
                       platform::WriteStatus::Progress &&
                   offset == line.size();

    std::string output;
    auto start_time = std::chrono::steady_clock::now();
    while (output.find('\n') == std::string::npos && test_support::elapsed_milliseconds(start_time) < 2000) {
        platform::ReadinessResult readiness = platform::wait_for_readable({spawn_result.stdout_descriptor}, 200);
        if (readiness.success && !readiness.timed_out && readiness.ready[0]) {
            platform::read_chunk(spawn_result.stdout_descriptor, output);
        }
    }

    bool all_passed = true;
    all_passed &= check(written, "Wrote a line to the child's stdin");
    all_passed &= check(output == "hello\n", "Read the same line back from its stdout");
    all_passed &= check(platform::check_process(spawn_result.process_id) == platform::ProcessStatus::Running,
                        "Child is running");

    platform::TerminateResult terminate_result = platform::terminate_process(spawn_result.process_id, 2000);
    all_passed &= check(terminate_result.success && !terminate_result.forced, "cat exited on SIGTERM");
    all_passed &= check(!test_support::process_exists(spawn_result.process_id), "Child is gone and reaped");

    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    all_passed &= check(spawn_result.stdin_descriptor == -1, "close_descriptor resets the descriptor");
    return all_passed;
}

// Test: an exited child is detected without blocking, and EOF is reported.
static bool test_exited_child_detected() {
    platform::SpawnResult spawn_result =
        platform::spawn_process("/bin/sh", {"-c", "exit 0"}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned a child that exits immediately")) {
        return false;
    }

    std::string output;
    platform::ReadinessResult readiness = platform::wait_for_readable({spawn_result.stdout_descriptor}, 2000);
    platform::ReadStatus status = platform::ReadStatus::Data;
    if (readiness.success && readiness.ready[0]) {
        status = platform::read_chunk(spawn_result.stdout_descriptor, output);
    }

    platform::ProcessStatus process_status = platform::ProcessStatus::Running;
    auto start_time = std::chrono::steady_clock::now();
    while (process_status == platform::ProcessStatus::Running &&
           test_support::elapsed_milliseconds(start_time) < 2000) {
        process_status = platform::check_process(spawn_result.process_id);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    bool all_passed = true;
    all_passed &= check(status == platform::ReadStatus::EndOfFile, "stdout reports EOF after the child exits");
    all_passed &= check(process_status == platform::ProcessStatus::Exited, "check_process reports Exited");
    all_passed &= check(platform::terminate_process(spawn_result.process_id, 100).success,
                        "Terminating an already exited child succeeds");

    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    return all_passed;
}

// Test: a child ignoring SIGTERM is killed after the grace period.
static bool test_terminate_forces_stubborn_child() {
    platform::SpawnResult spawn_result = platform::spawn_process(
        "/bin/sh", {"-c", "trap '' TERM; while :; do sleep 1; done"}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned a child that ignores SIGTERM")) {
        return false;
    }
    // Give the shell time to install its trap.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    auto start_time = std::chrono::steady_clock::now();
    platform::TerminateResult terminate_result = platform::terminate_process(spawn_result.process_id, 300);
    long elapsed = test_support::elapsed_milliseconds(start_time);

    bool all_passed = true;
    all_passed &= check(terminate_result.success && terminate_result.forced, "Child was force-killed");
    all_passed &= check(elapsed >= 300 && elapsed < 3000,
                        "Kill came after the grace period (" + std::to_string(elapsed) + " ms)");
    all_passed &= check(!test_support::process_exists(spawn_result.process_id), "Child is gone");

    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    return all_passed;
}

// Test: readiness wait honours its timeout.
static bool test_wait_for_readable_times_out() {
    platform::SpawnResult spawn_result =
        platform::spawn_process("/bin/cat", {}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned /bin/cat")) {
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    platform::ReadinessResult readiness = platform::wait_for_readable({spawn_result.stdout_descriptor}, 150);
    long elapsed = test_support::elapsed_milliseconds(start_time);

    bool success = readiness.success && readiness.timed_out && !readiness.ready[0] && elapsed >= 100;
    platform::terminate_process(spawn_result.process_id, 1000);
    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    return check(success, "wait_for_readable times out when nothing arrives (" + std::to_string(elapsed) + " ms)");
}

// Test: writing to a child that closed its stdin fails with EPIPE instead of killing us.
static bool test_write_to_closed_pipe_fails() {
    platform::ignore_broken_pipe_signal();
    platform::SpawnResult spawn_result =
        platform::spawn_process("/bin/sh", {"-c", "exec 0<&-; sleep 5"}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned a child that closes its stdin")) {
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::string error_message;
    size_t offset = 0;
    platform::WriteStatus status =
        platform::write_chunk(spawn_result.stdin_descriptor, "anything\n", offset, error_message);
    bool written = status != platform::WriteStatus::Failed;

    platform::terminate_process(spawn_result.process_id, 1000);
    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    return check(!written && error_message.find("broken pipe") != std::string::npos,
                 "Write to a closed pipe reports broken pipe (" + error_message + ")");
}

// Test: a full stdin pipe reports WouldBlock, and wait_for_writable still sees
// the child's other pipes while waiting.
static bool test_full_pipe_and_wait_for_writable() {
    // The child writes to stderr, then sleeps without reading stdin.
    platform::SpawnResult spawn_result = platform::spawn_process(
        "/bin/sh", {"-c", "echo ready >&2; sleep 5"}, platform::build_environment({}));
    if (!check(spawn_result.success, "Spawned a child that never reads stdin")) {
        return false;
    }

    const std::string payload(1024 * 1024, 'x');
    size_t offset = 0;
    std::string error_message;
    platform::WriteStatus status = platform::WriteStatus::Progress;
    while (status == platform::WriteStatus::Progress && offset < payload.size()) {
        status = platform::write_chunk(spawn_result.stdin_descriptor, payload, offset, error_message);
    }

    platform::ReadinessResult readiness = platform::wait_for_writable(
        spawn_result.stdin_descriptor, {-1, spawn_result.stderr_descriptor}, 2000);

    bool all_passed = true;
    all_passed &= check(status == platform::WriteStatus::WouldBlock && offset > 0 && offset < payload.size(),
                        "Writing past the pipe buffer reports WouldBlock (" + std::to_string(offset) + " bytes in)");
    all_passed &= check(readiness.success && !readiness.timed_out && !readiness.writable && !readiness.ready[0] &&
                            readiness.ready[1],
                        "wait_for_writable wakes for a readable stderr while stdin stays full");

    platform::terminate_process(spawn_result.process_id, 1000);
    platform::close_descriptor(spawn_result.stdin_descriptor);
    platform::close_descriptor(spawn_result.stdout_descriptor);
    platform::close_descriptor(spawn_result.stderr_descriptor);
    return all_passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_build_environment_merges_overrides();
    all_passed &= test_build_environment_leaves_process_untouched();
    all_passed &= test_find_executable();
    all_passed &= test_spawn_and_round_trip_through_cat();
    all_passed &= test_exited_child_detected();
    all_passed &= test_terminate_forces_stubborn_child();
    all_passed &= test_wait_for_readable_times_out();
    all_passed &= test_write_to_closed_pipe_fails();
    all_passed &= test_full_pipe_and_wait_for_writable();
    return all_passed;
}

} // namespace test_platform
