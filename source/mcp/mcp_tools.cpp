#include "mcp/mcp_tools.hpp"

#include <algorithm>

namespace mcp_tools {

static std::string string_member(const json &object, const char *key, const std::string &fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

static std::vector<ToolParameter> parse_parameters(const json &input_schema) {
    std::vector<ToolParameter> parameters;
    if (!input_schema.is_object() || !input_schema.contains("properties") ||
        !input_schema["properties"].is_object()) {
        return parameters;
    }

    std::vector<std::string> required_names;
    if (input_schema.contains("required") && input_schema["required"].is_array()) {
        for (const auto &entry : input_schema["required"]) {
            if (entry.is_string()) {
                required_names.push_back(entry.get<std::string>());
            }
        }
    }

    for (const auto &property : input_schema["properties"].items()) {
        ToolParameter parameter;
        parameter.name = property.key();
        parameter.type = string_member(property.value(), "type", "string");
        parameter.description = string_member(property.value(), "description", "");
        parameter.required = std::find(required_names.begin(), required_names.end(), parameter.name) !=
                             required_names.end();
        parameters.push_back(parameter);
    }
    return parameters;
}

std::vector<ToolDescriptor> parse_tools_list_result(const json &result) {
    std::vector<ToolDescriptor> tools;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return tools;
    }

    for (const auto &entry : result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return {};
        }

        ToolDescriptor tool;
        tool.name = entry["name"].get<std::string>();
        tool.description = string_member(entry, "description", "");
        if (entry.contains("inputSchema")) {
            tool.input_schema = entry["inputSchema"];
        }
        tool.parameters = parse_parameters(tool.input_schema);
        tool.raw = entry;
        tools.push_back(tool);
    }
    return tools;
}

json filter_empty_arguments(const json &arguments) {
    json filtered = json::object();
    if (!arguments.is_object()) {
        return filtered;
    }

    for (const auto &argument : arguments.items()) {
        const json &value = argument.value();
        if (value.is_null()) {
            continue;
        }
        if (value.is_boolean() && !value.get<bool>()) {
            continue;
        }
        if (value.is_string() && value.get_ref<const std::string &>().empty()) {
            continue;
        }
        if ((value.is_array() || value.is_object()) && value.empty()) {
            continue;
        }
        filtered[argument.key()] = value;
    }
    return filtered;
}

} // namespace mcp_tools
