#ifndef SMCPC_CLI_OPTIONS_HPP
#define SMCPC_CLI_OPTIONS_HPP

// Command-line configuration for the smcpc executable.
// Parsed with CLI11; everything the core needs is passed on explicitly.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "platform/platform_abi.hpp"
#include "session/process_session.hpp"

namespace cli_options {

using json = nlohmann::json;

struct CliOptions {
    std::string server_name = "server";
    std::string command;
    std::vector<std::string> arguments;
    platform::EnvironmentOverrides environment;
    session::SessionOptions session_options;
    bool handshake = false;
    bool list_tools = false;
    std::string tool_name;                 // empty: no tools/call
    json tool_arguments = json::object();
    bool keep_empty_arguments = false;
};

struct ParseResult {
    bool success = false;
    bool exit_requested = false; // --help or a usage error: print message, exit with exit_code
    int exit_code = 0;
    std::string message;
    CliOptions options;
};

// Parse argv. Never throws; usage errors come back with exit_code 2.
ParseResult parse_command_line(int argc, const char *const *argv);

// Split KEY=VALUE. The key must be non-empty; the value may be empty.
bool parse_environment_assignment(const std::string &assignment, std::string &key, std::string &value);

} // namespace cli_options

#endif // SMCPC_CLI_OPTIONS_HPP
