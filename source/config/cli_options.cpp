#include "config/cli_options.hpp"

#include <CLI/CLI.hpp>

#include <sstream>

namespace cli_options {

static ParseResult usage_error(const std::string &message) {
    ParseResult result;
    result.exit_requested = true;
    result.exit_code = 2;
    result.message = message;
    return result;
}

bool parse_environment_assignment(const std::string &assignment, std::string &key, std::string &value) {
    size_t equals_position = assignment.find('=');
    if (equals_position == std::string::npos || equals_position == 0) {
        return false;
    }
    key = assignment.substr(0, equals_position);
    value = assignment.substr(equals_position + 1);
    return true;
}

ParseResult parse_command_line(int argc, const char *const *argv) {
    CliOptions options;

    CLI::App app{"smcpc - launch an MCP tool provider and talk JSON-RPC to it over stdio"};

    std::vector<std::string> environment_assignments;
    std::vector<std::string> command_line;
    std::string arguments_text;
    int timeout_milliseconds = options.session_options.read_timeout_milliseconds;
    int grace_milliseconds = options.session_options.terminate_grace_milliseconds;

    app.add_option("-n,--name", options.server_name, "Logical name of the session");
    app.add_option("-e,--env", environment_assignments, "KEY=VALUE environment override (repeatable)");
    app.add_option("--timeout", timeout_milliseconds, "Response timeout in milliseconds");
    app.add_option("--grace", grace_milliseconds, "Grace period before SIGKILL on disconnect, in milliseconds");
    app.add_flag("--handshake", options.handshake, "Send initialize and notifications/initialized first");
    app.add_flag("--list", options.list_tools, "List the provider's tools");
    app.add_option("--call", options.tool_name, "Invoke this tool");
    app.add_option("--args", arguments_text, "Tool arguments as a JSON object");
    app.add_flag("--keep-empty", options.keep_empty_arguments, "Send empty argument values instead of dropping them");
    app.add_option("command", command_line, "Provider command and its arguments, after --");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &parse_error) {
        std::ostringstream out_stream;
        std::ostringstream error_stream;
        ParseResult result;
        result.exit_requested = true;
        result.exit_code = app.exit(parse_error, out_stream, error_stream);
        result.message = out_stream.str() + error_stream.str();
        return result;
    }

    if (command_line.empty()) {
        return usage_error("missing provider command (usage: smcpc [options] -- COMMAND [ARGS...])");
    }
    options.command = command_line.front();
    options.arguments.assign(command_line.begin() + 1, command_line.end());

    for (const auto &assignment : environment_assignments) {
        std::string key;
        std::string value;
        if (!parse_environment_assignment(assignment, key, value)) {
            return usage_error("invalid --env value '" + assignment + "' (expected KEY=VALUE)");
        }
        options.environment[key] = value;
    }

    if (timeout_milliseconds <= 0) {
        return usage_error("--timeout must be positive");
    }
    if (grace_milliseconds < 0) {
        return usage_error("--grace must not be negative");
    }
    options.session_options.read_timeout_milliseconds = timeout_milliseconds;
    options.session_options.terminate_grace_milliseconds = grace_milliseconds;

    if (!arguments_text.empty()) {
        if (options.tool_name.empty()) {
            return usage_error("--args requires --call");
        }
        try {
            options.tool_arguments = json::parse(arguments_text);
        } catch (const json::parse_error &parse_error) {
            return usage_error("--args is not valid JSON: " + std::string(parse_error.what()));
        }
        if (!options.tool_arguments.is_object()) {
            return usage_error("--args must be a JSON object");
        }
    }

    if (options.tool_name.empty() && !options.list_tools) {
        options.list_tools = true;
    }

    ParseResult result;
    result.success = true;
    result.options = options;
    return result;
}

} // namespace cli_options
