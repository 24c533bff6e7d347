#include "registry/session_registry.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace session_registry {

static std::once_flag broken_pipe_once;

SessionRegistry::SessionRegistry(session::SessionOptions options)
    : options_(options) {
    std::call_once(broken_pipe_once, platform::ignore_broken_pipe_signal);
}

SessionRegistry::~SessionRegistry() {
    disconnect_all();
}

bool SessionRegistry::connect(const std::string &name, const std::string &command,
                              const std::vector<std::string> &arguments,
                              const platform::EnvironmentOverrides &environment) {
    std::shared_ptr<std::mutex> lifecycle_mutex = name_lock(name);
    std::lock_guard<std::mutex> lifecycle_lock(*lifecycle_mutex);

    std::shared_ptr<session::ProcessSession> previous;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto session_iterator = sessions_.find(name);
        if (session_iterator != sessions_.end()) {
            previous = session_iterator->second;
            sessions_.erase(session_iterator);
        }
    }
    if (previous) {
        debug_log::info("Replacing session '" + name + "' (pid=" + std::to_string(previous->process_id()) + ")");
        previous->terminate();
    }

    auto new_session = std::make_shared<session::ProcessSession>(name, options_);
    session::LaunchSpec launch_spec;
    launch_spec.command = command;
    launch_spec.arguments = arguments;
    launch_spec.environment = environment;

    session::StartResult start_result = new_session->spawn(launch_spec);
    if (!start_result.success) {
        debug_log::info("Failed to connect session '" + name + "': " + start_result.error_message);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[name] = new_session;
    }
    debug_log::info("Connected session '" + name + "' (pid=" + std::to_string(new_session->process_id()) + ")");
    return true;
}

session::ExchangeResult SessionRegistry::initialize(const std::string &name, const std::string &client_name,
                                                    const std::string &client_version) {
    json params;
    params["protocolVersion"] = PROTOCOL_VERSION;
    params["capabilities"]["tools"] = json::object();
    params["clientInfo"]["name"] = client_name;
    params["clientInfo"]["version"] = client_version;

    session::ExchangeResult result = exchange(name, "initialize", params);
    if (!result.success) {
        return result;
    }

    std::shared_ptr<session::ProcessSession> target = find_session(name);
    if (!target) {
        // Disconnected between the two messages.
        session::ExchangeResult not_connected;
        not_connected.failure = session::FailureKind::NotConnected;
        not_connected.error_message = "No connection to " + name;
        return not_connected;
    }
    session::ExchangeResult notified = target->notify("notifications/initialized");
    if (!notified.success) {
        if (notified.failure == session::FailureKind::Transport) {
            evict(name, target);
        }
        return notified;
    }
    return result;
}

std::vector<mcp_tools::ToolDescriptor> SessionRegistry::list_tools(const std::string &name) {
    session::ExchangeResult result = exchange(name, "tools/list", nullptr);
    if (!result.success) {
        if (result.failure != session::FailureKind::NotConnected) {
            debug_log::info("tools/list on '" + name + "' failed: " + result.error_message);
        }
        return {};
    }

    std::vector<mcp_tools::ToolDescriptor> tools = mcp_tools::parse_tools_list_result(result.result);
    debug_log::log("tools/list on '" + name + "' returned " + std::to_string(tools.size()) + " tool(s)");
    return tools;
}

ToolCallResult SessionRegistry::call_tool(const std::string &name, const std::string &tool_name,
                                          const json &arguments) {
    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;

    ToolCallResult result = exchange(name, "tools/call", params);
    if (!result.success && result.failure != session::FailureKind::NotConnected) {
        debug_log::info("tools/call " + tool_name + " on '" + name + "' failed: " + result.error_message);
    }
    return result;
}

void SessionRegistry::disconnect(const std::string &name) {
    std::shared_ptr<std::mutex> lifecycle_mutex = name_lock(name);
    std::lock_guard<std::mutex> lifecycle_lock(*lifecycle_mutex);

    std::shared_ptr<session::ProcessSession> target;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto session_iterator = sessions_.find(name);
        if (session_iterator == sessions_.end()) {
            return;
        }
        target = session_iterator->second;
        sessions_.erase(session_iterator);
    }

    target->terminate();
    debug_log::info("Disconnected session '" + name + "'");
}

void SessionRegistry::disconnect_all() {
    std::map<std::string, std::shared_ptr<session::ProcessSession>> detached;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        detached.swap(sessions_);
    }

    // terminate() reports its own failures and never throws, so one stuck
    // child cannot stop the sweep.
    for (auto &entry : detached) {
        entry.second->terminate();
        debug_log::info("Disconnected session '" + entry.first + "'");
    }
}

bool SessionRegistry::is_connected(const std::string &name) {
    return find_session(name) != nullptr;
}

std::vector<std::string> SessionRegistry::connected_names() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> names;
    for (const auto &entry : sessions_) {
        names.push_back(entry.first);
    }
    return names;
}

size_t SessionRegistry::size() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::shared_ptr<std::mutex> SessionRegistry::name_lock(const std::string &name) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::shared_ptr<std::mutex> &lifecycle_mutex = name_locks_[name];
    if (!lifecycle_mutex) {
        lifecycle_mutex = std::make_shared<std::mutex>();
    }
    return lifecycle_mutex;
}

std::shared_ptr<session::ProcessSession> SessionRegistry::find_session(const std::string &name) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto session_iterator = sessions_.find(name);
    if (session_iterator == sessions_.end()) {
        return nullptr;
    }
    return session_iterator->second;
}

session::ExchangeResult SessionRegistry::exchange(const std::string &name, const std::string &method,
                                                  const json &params) {
    std::shared_ptr<session::ProcessSession> target = find_session(name);
    if (!target) {
        debug_log::log(method + ": no connection to " + name);
        session::ExchangeResult result;
        result.failure = session::FailureKind::NotConnected;
        result.error_message = "No connection to " + name;
        return result;
    }

    session::ExchangeResult result = target->request(method, params);

    // A session that lost its child or its framing cannot be trusted again.
    if (!result.success && result.failure == session::FailureKind::Transport) {
        evict(name, target);
    }
    return result;
}

void SessionRegistry::evict(const std::string &name, const std::shared_ptr<session::ProcessSession> &expected) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto session_iterator = sessions_.find(name);
        // A concurrent connect may already have replaced it.
        if (session_iterator != sessions_.end() && session_iterator->second == expected) {
            sessions_.erase(session_iterator);
        }
    }
    expected->terminate();
    debug_log::info("Dropped session '" + name + "' after a transport failure");
}

} // namespace session_registry
