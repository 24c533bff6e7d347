#ifndef SMCPC_PLATFORM_ABI_HPP
#define SMCPC_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace platform {

using EnvironmentOverrides = std::map<std::string, std::string>;

// Result of spawning a child process with piped standard streams.
// On success the three descriptors are the parent's ends of the pipes and are
// owned by the caller; stdin_descriptor is non-blocking.
struct SpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_descriptor = -1;
    int stdout_descriptor = -1;
    int stderr_descriptor = -1;
    std::string error_message;
};

// Copy of the inherited environment as KEY=VALUE entries with overrides
// applied on top (an override replaces an inherited entry with the same key).
std::vector<std::string> build_environment(const EnvironmentOverrides &overrides);

// Resolve a command to an executable path. Commands containing '/' are used
// as given; bare names are searched in the PATH entry of environment.
// Returns empty string if nothing executable was found.
std::string find_executable(const std::string &command, const std::vector<std::string> &environment);

// Spawn executable_path with arguments (argv[0] is added) and the given
// environment. stdin, stdout and stderr of the child are pipes. The child
// leads its own process group and starts with SIGPIPE at its default action.
SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::vector<std::string> &environment);

// Result of waiting for descriptors to become readable (or writable).
struct ReadinessResult {
    bool success = false;     // false when poll() itself failed
    bool timed_out = false;
    std::vector<bool> ready;  // per read descriptor: data available or peer hung up
    bool writable = false;    // wait_for_writable only: the write descriptor can take more
    std::string error_message;
};

// Wait up to timeout_milliseconds for any of descriptors to become readable.
// Negative descriptors are skipped. EINTR is retried with the remaining time.
ReadinessResult wait_for_readable(const std::vector<int> &descriptors, int timeout_milliseconds);

// Wait up to timeout_milliseconds for write_descriptor to become writable or
// any of read_descriptors to become readable, whichever comes first. Lets a
// writer keep draining the child's other pipes while its stdin is full.
ReadinessResult wait_for_writable(int write_descriptor, const std::vector<int> &read_descriptors,
                                  int timeout_milliseconds);

enum class ReadStatus {
    Data,
    EndOfFile,
    Failed
};

// Read whatever is available (up to one chunk) from descriptor and append it
// to buffer. Call after wait_for_readable reported the descriptor ready.
ReadStatus read_chunk(int descriptor, std::string &buffer);

enum class WriteStatus {
    Progress,   // some bytes were written (offset advanced)
    WouldBlock, // the pipe is full
    Failed      // EPIPE or another write error; error_message says which
};

// One non-blocking write of data from offset onwards; advances offset.
WriteStatus write_chunk(int descriptor, const std::string &data, size_t &offset, std::string &error_message);

// Close a descriptor if open and set it to -1.
void close_descriptor(int &descriptor);

enum class ProcessStatus {
    Running,
    Exited, // exited and reaped, or no longer our child
    Unknown // process_id was not valid
};

// Non-blocking liveness check. Reaps the child if it has exited.
ProcessStatus check_process(int process_id);

// Outcome of terminate_process.
struct TerminateResult {
    bool success = false;          // the process is gone and reaped
    bool forced = false;           // SIGKILL was needed
    std::string error_message;
};

// Send signal_number to the child's process group (falling back to the child
// alone). Returns false if neither could be signalled.
bool signal_process_group(int process_id, int signal_number);

// Send SIGTERM to the child's process group, wait up to grace_milliseconds for
// it to exit, then SIGKILL it. Always reaps the child before returning success.
TerminateResult terminate_process(int process_id, int grace_milliseconds);

// Ignore SIGPIPE in this process so writes to a dead child fail with EPIPE.
// Safe to call more than once.
void ignore_broken_pipe_signal();

} // namespace platform

#endif // SMCPC_PLATFORM_ABI_HPP
