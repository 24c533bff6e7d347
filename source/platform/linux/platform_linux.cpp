#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>

extern char **environ;

namespace platform {

static std::string describe_errno(const std::string &operation, int error_number) {
    return operation + " failed: " + std::string(strerror(error_number));
}

static void close_pipe(int pipe_descriptors[2]) {
    close_descriptor(pipe_descriptors[0]);
    close_descriptor(pipe_descriptors[1]);
}

static bool set_nonblocking(int descriptor) {
    int flags = fcntl(descriptor, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return fcntl(descriptor, F_SETFL, flags | O_NONBLOCK) != -1;
}

static int remaining_milliseconds(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return remaining > 0 ? static_cast<int>(remaining) : 0;
}

static bool is_executable_file(const std::string &path) {
    struct stat file_status;
    if (stat(path.c_str(), &file_status) != 0) {
        return false;
    }
    if (!S_ISREG(file_status.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> build_environment(const EnvironmentOverrides &overrides) {
    std::vector<std::string> environment;

    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string variable(*entry);
        std::string key = variable.substr(0, variable.find('='));
        if (overrides.count(key) != 0) {
            continue; // replaced by the override below
        }
        environment.push_back(variable);
    }

    for (const auto &entry : overrides) {
        environment.push_back(entry.first + "=" + entry.second);
    }
    return environment;
}

std::string find_executable(const std::string &command, const std::vector<std::string> &environment) {
    if (command.empty()) {
        return "";
    }

    // Absolute or relative path: use it as given.
    if (command.find('/') != std::string::npos) {
        return is_executable_file(command) ? command : "";
    }

    // Bare name: search the PATH the child will see.
    std::string path_value = "/usr/local/bin:/usr/bin:/bin";
    for (const auto &entry : environment) {
        if (entry.compare(0, 5, "PATH=") == 0) {
            path_value = entry.substr(5);
            break;
        }
    }

    std::istringstream path_stream(path_value);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            directory = ".";
        }
        std::string full_path = directory + "/" + command;
        if (is_executable_file(full_path)) {
            return full_path;
        }
    }
    return "";
}

SpawnResult spawn_process(const std::string &executable_path,
                          const std::vector<std::string> &arguments,
                          const std::vector<std::string> &environment) {
    SpawnResult result;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    // Close-on-exec everywhere: only the dup2 targets survive into the child,
    // so children spawned concurrently never inherit each other's pipes.
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        result.error_message = describe_errno("pipe2", errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    // Build argv array: [executable, arg1, arg2, ..., nullptr]
    std::vector<std::string> argv_strings;
    argv_strings.push_back(executable_path);
    argv_strings.insert(argv_strings.end(), arguments.begin(), arguments.end());
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(&argument_string[0]);
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = environment;
    std::vector<char *> environment_pointers;
    for (auto &variable : environment_strings) {
        environment_pointers.push_back(&variable[0]);
    }
    environment_pointers.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_adddup2(&file_actions, stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&file_actions, stderr_pipe[1], STDERR_FILENO);

    // The parent ignores SIGPIPE; an ignored disposition would survive exec.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attributes, &default_signals);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&attributes, &empty_mask);
    posix_spawnattr_setpgroup(&attributes, 0);
    posix_spawnattr_setflags(&attributes, static_cast<short>(POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK |
                                                             POSIX_SPAWN_SETPGROUP));

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(),
                                   &file_actions, &attributes,
                                   argv_pointers.data(), environment_pointers.data());

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attributes);

    // The child's ends are not ours to keep.
    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);
    close_descriptor(stderr_pipe[1]);

    if (spawn_status != 0) {
        result.error_message = describe_errno("posix_spawn", spawn_status);
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stderr_pipe[0]);
        return result;
    }

    if (!set_nonblocking(stdin_pipe[1]) || !set_nonblocking(stdout_pipe[0]) ||
        !set_nonblocking(stderr_pipe[0])) {
        int saved_errno = errno;
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        close_descriptor(stderr_pipe[0]);
        terminate_process(static_cast<int>(child_pid), 0);
        result.error_message = describe_errno("fcntl(O_NONBLOCK)", saved_errno);
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_descriptor = stdin_pipe[1];
    result.stdout_descriptor = stdout_pipe[0];
    result.stderr_descriptor = stderr_pipe[0];
    return result;
}

static ReadinessResult wait_for_events(int write_descriptor, const std::vector<int> &read_descriptors,
                                       int timeout_milliseconds) {
    ReadinessResult result;
    result.ready.assign(read_descriptors.size(), false);

    std::vector<pollfd> poll_descriptors;
    std::vector<size_t> poll_to_input_index;
    for (size_t index = 0; index < read_descriptors.size(); ++index) {
        if (read_descriptors[index] < 0) {
            continue;
        }
        pollfd entry;
        entry.fd = read_descriptors[index];
        entry.events = POLLIN;
        entry.revents = 0;
        poll_descriptors.push_back(entry);
        poll_to_input_index.push_back(index);
    }
    // The write descriptor, if any, sits after the read descriptors.
    size_t write_index = poll_descriptors.size();
    if (write_descriptor >= 0) {
        pollfd entry;
        entry.fd = write_descriptor;
        entry.events = POLLOUT;
        entry.revents = 0;
        poll_descriptors.push_back(entry);
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_milliseconds > 0 ? timeout_milliseconds : 0);

    for (;;) {
        int poll_status = ::poll(poll_descriptors.data(), static_cast<nfds_t>(poll_descriptors.size()),
                                 remaining_milliseconds(deadline));
        if (poll_status < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.error_message = describe_errno("poll", errno);
            return result;
        }

        result.success = true;
        if (poll_status == 0) {
            result.timed_out = true;
            return result;
        }

        for (size_t index = 0; index < poll_to_input_index.size(); ++index) {
            // POLLHUP/POLLERR/POLLNVAL count as ready: the following read reports what happened.
            if (poll_descriptors[index].revents != 0) {
                result.ready[poll_to_input_index[index]] = true;
            }
        }
        // POLLERR on a write end means the reader is gone; the next write reports EPIPE.
        if (write_descriptor >= 0 && poll_descriptors[write_index].revents != 0) {
            result.writable = true;
        }
        return result;
    }
}

ReadinessResult wait_for_readable(const std::vector<int> &descriptors, int timeout_milliseconds) {
    return wait_for_events(-1, descriptors, timeout_milliseconds);
}

ReadinessResult wait_for_writable(int write_descriptor, const std::vector<int> &read_descriptors,
                                  int timeout_milliseconds) {
    return wait_for_events(write_descriptor, read_descriptors, timeout_milliseconds);
}

ReadStatus read_chunk(int descriptor, std::string &buffer) {
    char chunk[4096];
    for (;;) {
        ssize_t bytes_read = ::read(descriptor, chunk, sizeof(chunk));
        if (bytes_read > 0) {
            buffer.append(chunk, static_cast<size_t>(bytes_read));
            return ReadStatus::Data;
        }
        if (bytes_read == 0) {
            return ReadStatus::EndOfFile;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadStatus::Data; // spurious wakeup, nothing appended
        }
        return ReadStatus::Failed;
    }
}

WriteStatus write_chunk(int descriptor, const std::string &data, size_t &offset, std::string &error_message) {
    if (descriptor < 0) {
        error_message = "write end is closed";
        return WriteStatus::Failed;
    }

    for (;;) {
        ssize_t bytes_written = ::write(descriptor, data.data() + offset, data.size() - offset);
        if (bytes_written >= 0) {
            offset += static_cast<size_t>(bytes_written);
            return bytes_written > 0 ? WriteStatus::Progress : WriteStatus::WouldBlock;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return WriteStatus::WouldBlock;
        }
        if (errno == EPIPE) {
            error_message = "broken pipe: child closed its stdin";
        } else {
            error_message = describe_errno("write", errno);
        }
        return WriteStatus::Failed;
    }
}

void close_descriptor(int &descriptor) {
    if (descriptor >= 0) {
        ::close(descriptor);
        descriptor = -1;
    }
}

ProcessStatus check_process(int process_id) {
    if (process_id <= 0) {
        return ProcessStatus::Unknown;
    }

    for (;;) {
        int status = 0;
        pid_t wait_result = waitpid(static_cast<pid_t>(process_id), &status, WNOHANG);
        if (wait_result == 0) {
            return ProcessStatus::Running;
        }
        if (wait_result < 0 && errno == EINTR) {
            continue;
        }
        // Reaped now, or ECHILD: either way it is no longer a live child of ours.
        return ProcessStatus::Exited;
    }
}

bool signal_process_group(int process_id, int signal_number) {
    if (process_id <= 0) {
        return false;
    }
    // The child leads its own group; reach wrapper-spawned grandchildren too.
    if (kill(-static_cast<pid_t>(process_id), signal_number) == 0) {
        return true;
    }
    return kill(static_cast<pid_t>(process_id), signal_number) == 0;
}

TerminateResult terminate_process(int process_id, int grace_milliseconds) {
    TerminateResult result;

    if (process_id <= 0) {
        result.error_message = "invalid process id " + std::to_string(process_id);
        return result;
    }

    if (check_process(process_id) != ProcessStatus::Running) {
        result.success = true;
        return result;
    }

    signal_process_group(process_id, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (check_process(process_id) != ProcessStatus::Running) {
            result.success = true;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (check_process(process_id) != ProcessStatus::Running) {
        result.success = true;
        return result;
    }

    signal_process_group(process_id, SIGKILL);
    result.forced = true;

    int status = 0;
    pid_t wait_result;
    do {
        wait_result = waitpid(static_cast<pid_t>(process_id), &status, 0);
    } while (wait_result < 0 && errno == EINTR);

    if (wait_result == static_cast<pid_t>(process_id) || (wait_result < 0 && errno == ECHILD)) {
        result.success = true;
    } else {
        result.error_message = describe_errno("waitpid", errno);
    }
    return result;
}

void ignore_broken_pipe_signal() {
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace platform
