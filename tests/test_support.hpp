#ifndef SMCPC_TEST_SUPPORT_HPP
#define SMCPC_TEST_SUPPORT_HPP

// Small helpers shared by the test suites.

#include <chrono>
#include <iostream>
#include <string>

#include <cerrno>
#include <signal.h>
#include <sys/types.h>

#ifndef SMCPC_MOCK_TOOL_SERVER_PATH
#error "SMCPC_MOCK_TOOL_SERVER_PATH must point at the smcpc_mock_tool_server binary"
#endif

namespace test_support {

inline const std::string &mock_server_path() {
    static const std::string path = SMCPC_MOCK_TOOL_SERVER_PATH;
    return path;
}

// Print OK/FAIL for one check and return its outcome.
inline bool check(bool condition, const std::string &description) {
    std::cout << (condition ? "  OK: " : "  FAIL: ") << description << std::endl;
    return condition;
}

// True while a process with this id exists (including zombies).
inline bool process_exists(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    return kill(static_cast<pid_t>(process_id), 0) == 0 || errno == EPERM;
}

inline long elapsed_milliseconds(std::chrono::steady_clock::time_point start_time) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count());
}

} // namespace test_support

#endif // SMCPC_TEST_SUPPORT_HPP
