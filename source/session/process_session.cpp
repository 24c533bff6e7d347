#include "session/process_session.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_sanitize.hpp"

#include <csignal>
#include <limits>
#include <thread>
#include <utility>

namespace session {

// Cap for a partial stderr line held while waiting for its newline.
static constexpr size_t kStderrLineMax = 4096;

// How often terminate() re-checks a signalled child.
static constexpr int kReapPollMilliseconds = 10;

// Upper bound on waiting for a SIGKILLed child to be reaped.
static constexpr int kKillWaitMilliseconds = 5000;

static int remaining_milliseconds(std::chrono::steady_clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return remaining > 0 ? static_cast<int>(remaining) : 0;
}

static bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

const char *to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::NotConnected:
        return "not_connected";
    case FailureKind::Spawn:
        return "spawn";
    case FailureKind::Transport:
        return "transport";
    case FailureKind::Protocol:
        return "protocol";
    }
    return "unknown";
}

json ExchangeResult::to_json() const {
    if (success) {
        return result;
    }

    json debug_info;
    debug_info["kind"] = to_string(failure);
    if (error_code.has_value()) {
        debug_info["code"] = *error_code;
    }
    if (!error_data.is_null()) {
        debug_info["data"] = error_data;
    }
    if (!error.is_null()) {
        debug_info["error"] = error;
    }

    json output;
    output["error"] = error_message;
    output["debug"] = debug_info;
    return output;
}

ProcessSession::ProcessSession(std::string name, SessionOptions options)
    : name_(std::move(name)), options_(options) {
}

ProcessSession::~ProcessSession() {
    terminate();
}

StartResult ProcessSession::spawn(const LaunchSpec &launch_spec) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    StartResult result;

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        if (started_ || terminate_requested_) {
            result.error_message = "session '" + name_ + "' was already spawned";
            return result;
        }
    }

    for (const auto &entry : launch_spec.environment) {
        if (entry.first.empty() || entry.first.find('=') != std::string::npos) {
            result.error_message = "invalid environment variable name '" + entry.first + "'";
            return result;
        }
    }

    std::vector<std::string> environment = platform::build_environment(launch_spec.environment);
    std::string executable_path = platform::find_executable(launch_spec.command, environment);
    if (executable_path.empty()) {
        result.error_message = "command '" + launch_spec.command + "' not found or not executable";
        return result;
    }

    platform::SpawnResult spawn_result =
        platform::spawn_process(executable_path, launch_spec.arguments, environment);
    if (!spawn_result.success) {
        result.error_message = "failed to spawn '" + executable_path + "': " + spawn_result.error_message;
        return result;
    }

    stdin_descriptor_ = spawn_result.stdin_descriptor;
    stdout_descriptor_ = spawn_result.stdout_descriptor;
    stderr_descriptor_ = spawn_result.stderr_descriptor;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        process_id_ = spawn_result.process_id;
        started_ = true;
        trusted_ = true;
    }

    debug_log::log("Session '" + name_ + "' spawned " + executable_path +
                   " (pid=" + std::to_string(spawn_result.process_id) + ", " +
                   std::to_string(launch_spec.arguments.size()) + " argument(s), " +
                   std::to_string(launch_spec.environment.size()) + " environment override(s))");
    result.success = true;
    return result;
}

ExchangeResult ProcessSession::request(const std::string &method, const json &params) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);

    if (!is_alive()) {
        return unusable_result();
    }

    int64_t request_id = next_request_id_++;
    json envelope = json_rpc::build_request(request_id, method, params);
    // Invalid UTF-8 from the caller is replaced rather than thrown on.
    std::string request_line = envelope.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    debug_log::log("Session '" + name_ + "' -> " + text_sanitize::printable_excerpt(request_line));

    // One deadline covers writing the request and reading its response.
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.read_timeout_milliseconds);

    std::string error_message;
    if (!write_line(request_line, deadline, error_message)) {
        return transport_failure("sending " + method + " failed: " + error_message);
    }

    for (;;) {
        std::string response_line;
        if (!read_line(response_line, deadline, error_message)) {
            return transport_failure(method + ": " + error_message);
        }
        if (is_blank(response_line)) {
            continue;
        }

        debug_log::log("Session '" + name_ + "' <- " + text_sanitize::printable_excerpt(response_line));

        json message;
        try {
            message = json::parse(response_line);
        } catch (const json::parse_error &parse_error) {
            debug_log::info("Session '" + name_ + "': unparseable response line: " +
                            text_sanitize::printable_excerpt(response_line));
            return transport_failure(method + ": response is not valid JSON (" +
                                     std::string(parse_error.what()) + ")");
        }

        if (message.is_object() && message.contains("method")) {
            // Server-initiated notifications may precede the response.
            if (json_rpc::is_notification(message)) {
                debug_log::log("Session '" + name_ + "': skipped notification " + json_rpc::get_method(message));
                continue;
            }
            // So may server-initiated requests (ping, sampling, ...); each is answered.
            if (!answer_child_request(message, deadline, error_message)) {
                return transport_failure(method + ": answering " + json_rpc::get_method(message) +
                                         " from the child failed: " + error_message);
            }
            continue;
        }

        json response_id = json_rpc::get_id(message);
        if (!response_id.is_null() && response_id != json(request_id)) {
            debug_log::log("Session '" + name_ + "': response id " + response_id.dump() +
                           " differs from request id " + std::to_string(request_id));
        }

        ExchangeResult result;
        switch (json_rpc::classify_response(message)) {
        case json_rpc::ResponseKind::Result:
            result.success = true;
            result.result = message["result"];
            return result;

        case json_rpc::ResponseKind::Error: {
            const json &error_object = message["error"];
            result.failure = FailureKind::Protocol;
            result.error = error_object;
            result.error_message = "child returned an error";
            if (error_object.is_object()) {
                if (error_object.contains("message") && error_object["message"].is_string()) {
                    result.error_message = error_object["message"].get<std::string>();
                }
                const json &code = error_object.contains("code") ? error_object["code"] : json();
                if (code.is_number_unsigned()) {
                    if (code.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        result.error_code = static_cast<int64_t>(code.get<uint64_t>());
                    }
                } else if (code.is_number_integer()) {
                    result.error_code = code.get<int64_t>();
                }
                if (error_object.contains("data")) {
                    result.error_data = error_object["data"];
                }
            } else if (error_object.is_string()) {
                result.error_message = error_object.get<std::string>();
            }
            return result;
        }

        case json_rpc::ResponseKind::Invalid:
            break;
        }
        return transport_failure(method + ": invalid response format (neither result nor error)");
    }
}

ExchangeResult ProcessSession::notify(const std::string &method, const json &params) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);

    if (!is_alive()) {
        return unusable_result();
    }

    json envelope = json_rpc::build_notification(method, params);
    std::string notification_line = envelope.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    debug_log::log("Session '" + name_ + "' -> " + text_sanitize::printable_excerpt(notification_line));

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options_.read_timeout_milliseconds);
    std::string error_message;
    if (!write_line(notification_line, deadline, error_message)) {
        return transport_failure("sending " + method + " failed: " + error_message);
    }

    ExchangeResult result;
    result.success = true;
    return result;
}

void ProcessSession::terminate() {
    std::lock_guard<std::mutex> terminate_lock(terminate_mutex_);

    bool signal_child = false;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        if (terminated_) {
            return;
        }
        terminate_requested_ = true;
        trusted_ = false;
        signal_child = started_ && !child_reaped_;
    }

    // With no exchange in flight, EOF on stdin lets a well-behaved provider
    // exit before it is signalled. Otherwise the in-flight exchange still owns
    // the pipes; the signal below ends its read.
    std::unique_lock<std::mutex> exchange_lock(exchange_mutex_, std::try_to_lock);
    if (exchange_lock.owns_lock()) {
        platform::close_descriptor(stdin_descriptor_);
    }

    if (signal_child) {
        stop_child();
    }

    if (!exchange_lock.owns_lock()) {
        exchange_lock.lock();
    }
    flush_stderr_lines(true);
    platform::close_descriptor(stdin_descriptor_);
    platform::close_descriptor(stdout_descriptor_);
    platform::close_descriptor(stderr_descriptor_);
    stdout_buffer_.clear();
    stderr_buffer_.clear();

    std::lock_guard<std::mutex> state_lock(state_mutex_);
    terminated_ = true;
}

bool ProcessSession::is_alive() {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    if (!started_ || terminate_requested_ || !trusted_ || child_reaped_) {
        return false;
    }
    if (reap_if_exited_locked()) {
        debug_log::info("Session '" + name_ + "': child process " + std::to_string(process_id_) + " has exited");
        return false;
    }
    return true;
}

int ProcessSession::process_id() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return process_id_;
}

int64_t ProcessSession::request_count() const {
    return next_request_id_.load() - 1;
}

// SIGTERM to the child's group, poll for exit through the grace period, then
// SIGKILL. Signals are sent under state_mutex_ so a concurrent liveness check
// can never reap the child in between and let its pid be reused.
void ProcessSession::stop_child() {
    int target_process_id;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        target_process_id = process_id_;
        if (reap_if_exited_locked()) {
            return;
        }
        platform::signal_process_group(target_process_id, SIGTERM);
    }

    auto grace_deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options_.terminate_grace_milliseconds);
    for (;;) {
        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            if (reap_if_exited_locked()) {
                return;
            }
            if (std::chrono::steady_clock::now() >= grace_deadline) {
                platform::signal_process_group(target_process_id, SIGKILL);
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMilliseconds));
    }

    debug_log::info("Session '" + name_ + "': pid " + std::to_string(target_process_id) + " ignored SIGTERM for " +
                    std::to_string(options_.terminate_grace_milliseconds) + " ms and was killed");

    auto kill_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kKillWaitMilliseconds);
    while (std::chrono::steady_clock::now() < kill_deadline) {
        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            if (reap_if_exited_locked()) {
                return;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kReapPollMilliseconds));
    }
    debug_log::info("Session '" + name_ + "': pid " + std::to_string(target_process_id) +
                    " was not reaped " + std::to_string(kKillWaitMilliseconds) + " ms after SIGKILL");
}

bool ProcessSession::reap_if_exited_locked() {
    if (!child_reaped_ && platform::check_process(process_id_) != platform::ProcessStatus::Running) {
        child_reaped_ = true;
    }
    return child_reaped_;
}

ExchangeResult ProcessSession::unusable_result() {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    ExchangeResult result;
    if (!started_ || terminate_requested_) {
        result.failure = FailureKind::NotConnected;
        result.error_message = "session '" + name_ + "' is not connected";
    } else if (!trusted_) {
        result.failure = FailureKind::Transport;
        result.error_message = "session '" + name_ + "' is no longer trustworthy after a transport failure";
    } else {
        result.failure = FailureKind::Transport;
        result.error_message = "child process of session '" + name_ + "' has exited";
    }
    return result;
}

ExchangeResult ProcessSession::transport_failure(const std::string &message) {
    bool disconnecting;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        trusted_ = false;
        disconnecting = terminate_requested_;
    }

    ExchangeResult result;
    result.failure = FailureKind::Transport;
    if (disconnecting) {
        result.error_message = "session '" + name_ + "' was disconnected during the exchange (" + message + ")";
        debug_log::log("Session '" + name_ + "': " + result.error_message);
    } else {
        result.error_message = message;
        debug_log::info("Session '" + name_ + "': transport failure: " + message);
    }
    return result;
}

// Write one line to the child's stdin. While the pipe is full the child's
// stdout and stderr keep being drained, so a child blocked writing to either
// of them can go on to read what we send.
bool ProcessSession::write_line(const std::string &line, std::chrono::steady_clock::time_point deadline,
                                std::string &error_message) {
    size_t offset = 0;
    while (offset < line.size()) {
        platform::WriteStatus status = platform::write_chunk(stdin_descriptor_, line, offset, error_message);
        if (status == platform::WriteStatus::Failed) {
            return false;
        }
        if (status == platform::WriteStatus::Progress) {
            continue;
        }

        int remaining = remaining_milliseconds(deadline);
        if (remaining == 0) {
            error_message = "timed out writing to child stdin";
            return false;
        }
        platform::ReadinessResult readiness =
            platform::wait_for_writable(stdin_descriptor_, {stdout_descriptor_, stderr_descriptor_}, remaining);
        if (!readiness.success) {
            error_message = readiness.error_message;
            return false;
        }
        if (readiness.timed_out) {
            continue; // the deadline check above reports it
        }
        if (readiness.ready[1]) {
            drain_stderr();
        }
        if (readiness.ready[0] && !pump_stdout(error_message)) {
            return false;
        }
    }
    return true;
}

bool ProcessSession::read_line(std::string &line, std::chrono::steady_clock::time_point deadline,
                               std::string &error_message) {
    for (;;) {
        size_t newline_position = stdout_buffer_.find('\n');
        if (newline_position != std::string::npos) {
            line = stdout_buffer_.substr(0, newline_position);
            stdout_buffer_.erase(0, newline_position + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (stdout_buffer_.size() > options_.maximum_line_bytes) {
            error_message = "response line exceeds " + std::to_string(options_.maximum_line_bytes) + " bytes";
            return false;
        }

        int remaining = remaining_milliseconds(deadline);
        if (remaining == 0) {
            error_message = "timed out after " + std::to_string(options_.read_timeout_milliseconds) +
                            " ms waiting for a response line";
            return false;
        }

        platform::ReadinessResult readiness =
            platform::wait_for_readable({stdout_descriptor_, stderr_descriptor_}, remaining);
        if (!readiness.success) {
            error_message = readiness.error_message;
            return false;
        }
        if (readiness.timed_out) {
            continue; // the deadline check above reports it
        }

        // stderr is diagnostic only, but must be drained or a chatty child blocks.
        if (readiness.ready[1]) {
            drain_stderr();
        }

        if (readiness.ready[0] && !pump_stdout(error_message)) {
            return false;
        }
    }
}

// Read what the child has written to stdout into stdout_buffer_.
bool ProcessSession::pump_stdout(std::string &error_message) {
    platform::ReadStatus status = platform::read_chunk(stdout_descriptor_, stdout_buffer_);
    if (status == platform::ReadStatus::EndOfFile) {
        error_message = "child closed stdout (EOF)";
        return false;
    }
    if (status == platform::ReadStatus::Failed) {
        error_message = "reading child stdout failed";
        return false;
    }
    return true;
}

// The client offers no capabilities, so only ping gets a real answer.
bool ProcessSession::answer_child_request(const json &message, std::chrono::steady_clock::time_point deadline,
                                          std::string &error_message) {
    std::string method = json_rpc::get_method(message);
    json answer;
    if (method == "ping") {
        answer = json_rpc::build_response(json_rpc::get_id(message), json::object());
    } else {
        answer = json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::METHOD_NOT_FOUND,
                                                "Method not found");
    }
    debug_log::log("Session '" + name_ + "': child sent request " + method + ", answering " +
                   (answer.contains("error") ? "method not found" : "with an empty result"));
    return write_line(answer.dump(-1, ' ', false, json::error_handler_t::replace) + "\n", deadline, error_message);
}

void ProcessSession::drain_stderr() {
    if (stderr_descriptor_ < 0) {
        return;
    }
    platform::ReadStatus status = platform::read_chunk(stderr_descriptor_, stderr_buffer_);
    if (status != platform::ReadStatus::Data) {
        // Closed stderr stays closed; stop polling it.
        flush_stderr_lines(true);
        platform::close_descriptor(stderr_descriptor_);
        return;
    }
    flush_stderr_lines(false);
}

void ProcessSession::flush_stderr_lines(bool include_partial) {
    size_t newline_position;
    while ((newline_position = stderr_buffer_.find('\n')) != std::string::npos) {
        debug_log::log("Session '" + name_ + "' stderr: " +
                       text_sanitize::printable_excerpt(stderr_buffer_.substr(0, newline_position)));
        stderr_buffer_.erase(0, newline_position + 1);
    }
    if (!stderr_buffer_.empty() && (include_partial || stderr_buffer_.size() > kStderrLineMax)) {
        debug_log::log("Session '" + name_ + "' stderr: " + text_sanitize::printable_excerpt(stderr_buffer_));
        stderr_buffer_.clear();
    }
}

} // namespace session
