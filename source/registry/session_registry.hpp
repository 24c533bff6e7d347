#ifndef SMCPC_SESSION_REGISTRY_HPP
#define SMCPC_SESSION_REGISTRY_HPP

// Name-indexed collection of process sessions and the blocking facade the
// collaborators call: connect, list_tools, call_tool, disconnect.
//
// Every call returns only once its exchange (or failure) is complete. Calls on
// different sessions may run concurrently from different threads; calls on the
// same session are serialized by the session itself.

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "session/process_session.hpp"

namespace session_registry {

using json = nlohmann::json;
using ToolCallResult = session::ExchangeResult;

// MCP protocol revision sent by initialize().
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Client identity sent by initialize() unless the caller supplies one.
static const std::string CLIENT_NAME = "smcpc";
static const std::string CLIENT_VERSION = "0.1.0";

class SessionRegistry {
public:
    explicit SessionRegistry(session::SessionOptions options = session::SessionOptions());
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry &) = delete;
    SessionRegistry &operator=(const SessionRegistry &) = delete;

    // Spawn a session under name, replacing (and first terminating) any
    // session already there. Returns false if the child could not be spawned;
    // the name is then left unconnected. Does not speak to the child.
    bool connect(const std::string &name, const std::string &command,
                 const std::vector<std::string> &arguments,
                 const platform::EnvironmentOverrides &environment = {});

    // MCP handshake: initialize request, then notifications/initialized.
    session::ExchangeResult initialize(const std::string &name,
                                       const std::string &client_name = CLIENT_NAME,
                                       const std::string &client_version = CLIENT_VERSION);

    // tools/list. Empty when not connected or on any failure.
    std::vector<mcp_tools::ToolDescriptor> list_tools(const std::string &name);

    // tools/call with {name: tool_name, arguments: arguments}. The raw result
    // on success; otherwise a structured error (see ExchangeResult).
    ToolCallResult call_tool(const std::string &name, const std::string &tool_name, const json &arguments);

    // Terminate and forget the session under name. No-op if there is none.
    void disconnect(const std::string &name);

    // Terminate every session. Used at shutdown.
    void disconnect_all();

    bool is_connected(const std::string &name);
    std::vector<std::string> connected_names();
    size_t size();

private:
    std::shared_ptr<std::mutex> name_lock(const std::string &name);
    std::shared_ptr<session::ProcessSession> find_session(const std::string &name);
    session::ExchangeResult exchange(const std::string &name, const std::string &method, const json &params);
    void evict(const std::string &name, const std::shared_ptr<session::ProcessSession> &expected);

    const session::SessionOptions options_;

    // Guards both maps; never held during an exchange or a terminate.
    std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<session::ProcessSession>> sessions_;

    // One lock per name, serializing connect/disconnect on that name so
    // replacing it never leaves two children alive under it. A slow teardown
    // holds up only callers of the same name. Taken before sessions_mutex_.
    std::map<std::string, std::shared_ptr<std::mutex>> name_locks_;
};

} // namespace session_registry

#endif // SMCPC_SESSION_REGISTRY_HPP
