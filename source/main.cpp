// smcpc - stdio MCP client
// Entry point: launches one tool provider as a child process, optionally
// performs the MCP handshake, lists its tools and/or calls one of them.
//
// Results go to stdout as JSON or plain text. Logs go to stderr.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "config/cli_options.hpp"
#include "mcp/mcp_tools.hpp"
#include "registry/session_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

static void print_tools(const std::vector<mcp_tools::ToolDescriptor> &tools) {
    if (tools.empty()) {
        std::cout << "No tools available." << std::endl;
        return;
    }

    std::cout << "Available tools (" << tools.size() << "):" << std::endl;
    for (const auto &tool : tools) {
        std::cout << "  " << tool.name;
        if (!tool.description.empty()) {
            std::cout << " - " << tool.description;
        }
        std::cout << std::endl;

        for (const auto &parameter : tool.parameters) {
            std::cout << "      " << parameter.name << (parameter.required ? "*" : "")
                      << " (" << parameter.type << ")";
            if (!parameter.description.empty()) {
                std::cout << ": " << parameter.description;
            }
            std::cout << std::endl;
        }
    }
}

int main(int argc, char **argv) {
    cli_options::ParseResult parsed = cli_options::parse_command_line(argc, argv);
    if (!parsed.success) {
        (parsed.exit_code == 0 ? std::cout : std::cerr) << parsed.message;
        if (!parsed.message.empty() && parsed.message.back() != '\n') {
            (parsed.exit_code == 0 ? std::cout : std::cerr) << std::endl;
        }
        return parsed.exit_code;
    }
    const cli_options::CliOptions &options = parsed.options;

    debug_log::log("smcpc build " + std::string(__DATE__) + " " + std::string(__TIME__));

    session_registry::SessionRegistry registry(options.session_options);

    if (!registry.connect(options.server_name, options.command, options.arguments, options.environment)) {
        std::cerr << "Failed to start tool provider '" << options.command << "'." << std::endl;
        return 1;
    }

    int exit_code = 0;

    if (options.handshake) {
        session::ExchangeResult initialize_result = registry.initialize(options.server_name);
        if (!initialize_result.success) {
            std::cerr << "Initialization failed:" << std::endl;
            std::cerr << initialize_result.to_json().dump(2) << std::endl;
            registry.disconnect_all();
            return 1;
        }
        debug_log::log("initialize result: " + initialize_result.result.dump());
    }

    if (options.list_tools) {
        print_tools(registry.list_tools(options.server_name));
    }

    if (!options.tool_name.empty()) {
        json arguments = options.keep_empty_arguments
                             ? options.tool_arguments
                             : mcp_tools::filter_empty_arguments(options.tool_arguments);

        session_registry::ToolCallResult call_result =
            registry.call_tool(options.server_name, options.tool_name, arguments);
        std::cout << call_result.to_json().dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        if (!call_result.success) {
            std::cerr << "Tool execution failed: " << call_result.error_message << std::endl;
            exit_code = 1;
        }
    }

    registry.disconnect_all();
    return exit_code;
}
