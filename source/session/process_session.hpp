#ifndef SMCPC_PROCESS_SESSION_HPP
#define SMCPC_PROCESS_SESSION_HPP

// One live connection to a tool-provider child process.
// Owns the child and its three pipes, and performs one blocking
// write-request-then-read-line exchange at a time.

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "platform/platform_abi.hpp"

namespace session {

using json = nlohmann::json;

// Explicit tuning values; nothing here is read from the environment.
struct SessionOptions {
    int read_timeout_milliseconds = 30000;
    int terminate_grace_milliseconds = 5000;
    size_t maximum_line_bytes = 64 * 1024 * 1024;
};

// How to launch the child.
struct LaunchSpec {
    std::string command;
    std::vector<std::string> arguments;
    platform::EnvironmentOverrides environment; // merged over the inherited environment
};

enum class FailureKind {
    None,
    NotConnected, // no session under that name
    Spawn,        // executable missing or the OS refused to launch it
    Transport,    // broken pipe, EOF, timeout, malformed line, dead child
    Protocol      // the child answered with a JSON-RPC error object
};

const char *to_string(FailureKind kind);

// Outcome of one exchange.
struct ExchangeResult {
    bool success = false;
    FailureKind failure = FailureKind::None;
    json result;                   // the "result" member on success
    json error;                    // the child's "error" member, verbatim
    std::optional<int64_t> error_code; // error.code when it is an integer
    json error_data;               // error.data when present
    std::string error_message;

    // Collaborator-facing shape: the raw result on success, otherwise
    // {"error": message, "debug": {"kind", "code"?, "data"?, "error"?}}.
    json to_json() const;
};

// Outcome of spawn().
struct StartResult {
    bool success = false;
    std::string error_message;
};

class ProcessSession {
public:
    ProcessSession(std::string name, SessionOptions options);
    ~ProcessSession();

    ProcessSession(const ProcessSession &) = delete;
    ProcessSession &operator=(const ProcessSession &) = delete;

    // Launch the child with piped stdin/stdout/stderr. Never throws.
    StartResult spawn(const LaunchSpec &launch_spec);

    // Send one request line and read one response line, bounded by the read
    // timeout. A null params value is left out of the envelope.
    ExchangeResult request(const std::string &method, const json &params = nullptr);

    // Send one notification line; nothing is read back.
    ExchangeResult notify(const std::string &method, const json &params = nullptr);

    // SIGTERM, grace period, then SIGKILL. Releases the pipes. Idempotent.
    // Does not wait for an exchange in flight: the child is signalled first,
    // which ends the blocked read, and the pipes are released afterwards.
    void terminate();

    // Non-blocking; false once the child exited, was terminated, or a
    // transport failure made the session untrustworthy. Never waits for an
    // exchange in flight.
    bool is_alive();

    const std::string &name() const { return name_; }
    int process_id() const;
    int64_t request_count() const;

private:
    void stop_child();
    bool reap_if_exited_locked();
    ExchangeResult unusable_result();
    ExchangeResult transport_failure(const std::string &message);
    bool write_line(const std::string &line, std::chrono::steady_clock::time_point deadline,
                    std::string &error_message);
    bool read_line(std::string &line, std::chrono::steady_clock::time_point deadline,
                   std::string &error_message);
    bool answer_child_request(const json &message, std::chrono::steady_clock::time_point deadline,
                              std::string &error_message);
    bool pump_stdout(std::string &error_message);
    void drain_stderr();
    void flush_stderr_lines(bool include_partial);

    const std::string name_;
    const SessionOptions options_;

    // Held for the whole of each exchange: at most one request in flight.
    // Guards the descriptors and buffers below.
    std::mutex exchange_mutex_;

    // Serializes terminate() callers, so a second caller returns only once
    // the child is gone.
    std::mutex terminate_mutex_;

    // Guards the process state below. Only ever held briefly, never while
    // waiting on the child, so is_alive() and terminate() do not block
    // behind an exchange.
    mutable std::mutex state_mutex_;

    int stdin_descriptor_ = -1;
    int stdout_descriptor_ = -1;
    int stderr_descriptor_ = -1;
    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::atomic<int64_t> next_request_id_{1};

    int process_id_ = -1;
    bool started_ = false;
    bool trusted_ = false;
    bool child_reaped_ = false;
    bool terminate_requested_ = false;
    bool terminated_ = false;
};

} // namespace session

#endif // SMCPC_PROCESS_SESSION_HPP
