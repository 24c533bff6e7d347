#ifndef SMCPC_MCP_TOOLS_HPP
#define SMCPC_MCP_TOOLS_HPP

// MCP tool descriptors as advertised by a provider's tools/list result.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// One entry of inputSchema.properties.
struct ToolParameter {
    std::string name;
    std::string type;        // "string" when the schema gives none
    std::string description;
    bool required = false;
};

// Description of a tool exposed by a child, matching the MCP tool schema.
// input_schema is kept exactly as received and is not validated.
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;                 // null when the tool advertised none
    std::vector<ToolParameter> parameters;
    json raw;                          // the full tools[] entry as received
};

// Extract the tools array from a tools/list result payload.
// Anything malformed (no tools array, an entry that is not an object or has
// no string name) yields an empty vector, never a partial one.
std::vector<ToolDescriptor> parse_tools_list_result(const json &result);

// Drop arguments whose value is null, "", [], {} or false, so a provider
// never receives empty placeholders for parameters the user left blank.
// Numbers are always kept, 0 included: unlike a plain truthiness test, a zero
// page, offset or count is treated as a real value.
json filter_empty_arguments(const json &arguments);

} // namespace mcp_tools

#endif // SMCPC_MCP_TOOLS_HPP
